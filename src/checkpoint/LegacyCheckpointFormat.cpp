//
// Compatibility with checkpoint files and keys written by older releases
//

#include "LegacyCheckpointFormat.hpp"

namespace oplogsync::checkpoint::legacy {
    namespace {
        bool isEntry(const nlohmann::json &value) {
            return value.is_array() && value.size() == 2 &&
                   value[0].is_string() && value[1].is_number_integer() &&
                   (value[1].is_number_unsigned() || value[1].get<int64_t>() >= 0);
        }

        std::pair<std::string, Timestamp> toEntry(const nlohmann::json &value) {
            return std::make_pair(
                value[0].get<std::string>(),
                Timestamp::fromInt64(value[1].get<uint64_t>())
            );
        }
    }

    std::optional<std::vector<std::pair<std::string, Timestamp>>> parseDocument(const nlohmann::json &document) {
        if (!document.is_array()) {
            return std::nullopt;
        }

        std::vector<std::pair<std::string, Timestamp>> entries;

        if (isEntry(document)) {
            entries.push_back(toEntry(document));
            return entries;
        }

        for (const auto &value: document) {
            if (!isEntry(value)) {
                return std::nullopt;
            }

            entries.push_back(toEntry(value));
        }

        return entries;
    }

    nlohmann::json toDocument(const std::vector<std::pair<std::string, Timestamp>> &entries) {
        auto toJson = [](const std::pair<std::string, Timestamp> &entry) {
            return nlohmann::json::array({ entry.first, entry.second.toInt64() });
        };

        if (entries.size() == 1) {
            return toJson(entries.front());
        }

        auto document = nlohmann::json::array();
        for (const auto &entry: entries) {
            document.push_back(toJson(entry));
        }

        return document;
    }

    std::string legacyKey(const std::string &streamId) {
        return streamId;
    }

    void migrateKey(CheckpointTable &table, const std::string &streamId) {
        table.erase(legacyKey(streamId));
    }

    std::optional<Timestamp> lookup(const CheckpointTable &table, const std::string &streamId, const std::string &name) {
        auto it = table.find(name);
        if (it != table.end()) {
            return it->second;
        }

        it = table.find(legacyKey(streamId));
        if (it != table.end()) {
            return it->second;
        }

        return std::nullopt;
    }
}
