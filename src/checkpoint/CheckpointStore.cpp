//
// Per-stream replication checkpoints, persisted to a JSON file
//

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "CheckpointStore.hpp"

namespace fs = std::filesystem;

namespace {
    bool hasContent(const std::string &path) {
        std::error_code ec;

        if (!fs::is_regular_file(path, ec)) {
            return false;
        }

        auto size = fs::file_size(path, ec);
        return !ec && size > 0;
    }
}

namespace oplogsync::checkpoint {
    CheckpointStore::CheckpointStore(std::optional<std::string> path):
        _logger(createLogger("CheckpointStore")),
        _path(std::move(path)),
        _isLoaded(false)
    {
        if (_path.has_value() && _path->empty()) {
            _path = std::nullopt;
        }
    }

    void CheckpointStore::load() {
        if (!_path.has_value()) {
            return;
        }

        if (_isLoaded) {
            _logger->warn("checkpoint file {} is already loaded", *_path);
            return;
        }
        _isLoaded = true;

        std::string source = *_path;

        if (!hasContent(source)) {
            auto backup = backupPath();

            if (!hasContent(backup)) {
                _logger->info("checkpoint file {} is missing or empty", *_path);
                return;
            }

            _logger->warn("checkpoint file {} is missing or empty; recovering from {}", *_path, backup);
            source = backup;
        }

        std::ifstream inputStream(source);
        if (!inputStream.is_open()) {
            _logger->error("failed to open checkpoint file {}", source);
            return;
        }

        std::stringstream buffer;
        buffer << inputStream.rdbuf();
        inputStream.close();

        auto document = nlohmann::json::parse(buffer.str(), nullptr, false);
        std::optional<std::vector<std::pair<std::string, Timestamp>>> entries;
        if (!document.is_discarded()) {
            entries = legacy::parseDocument(document);
        }

        if (!entries.has_value()) {
            if (source == *_path) {
                _logger->error(
                    "cannot read checkpoint file {}. it may be corrupt after an unclean shutdown. "
                    "you can try to recover from the backup file {}, or remove it to resume "
                    "from the current moment in time.",
                    source, backupPath()
                );
            } else {
                _logger->error(
                    "cannot read checkpoint backup file {}. remove it to resume "
                    "from the current moment in time.",
                    source
                );
            }
            return;
        }

        std::scoped_lock lock(_mutex);
        for (auto &[name, timestamp]: *entries) {
            _table[name] = timestamp;
        }

        _logger->info("loaded {} checkpoint(s) from {}", _table.size(), source);
    }

    bool CheckpointStore::save() {
        if (!_path.has_value()) {
            return true;
        }

        // held across snapshot and write so an older snapshot never lands after a newer one
        std::scoped_lock saveLock(_saveMutex);

        std::vector<std::pair<std::string, Timestamp>> items;
        {
            std::scoped_lock lock(_mutex);
            items.assign(_table.begin(), _table.end());
        }

        if (items.empty()) {
            return true;
        }

        const auto payload = legacy::toDocument(items).dump();
        const auto backup = backupPath();
        std::error_code ec;

        if (fs::exists(*_path, ec)) {
            fs::rename(*_path, backup, ec);

            if (ec) {
                _logger->error("failed to move {} to {}: {}", *_path, backup, ec.message());
                return false;
            }
        }

        if (!writeFile(*_path, payload)) {
            _logger->error("failed to write checkpoint file {}", *_path);

            if (!restoreFromBackup(backup)) {
                throw CheckpointPersistenceError(fmt::format(
                    "failed to write {} and to restore it from {}", *_path, backup
                ));
            }

            return false;
        }

        if (fs::exists(backup, ec)) {
            fs::remove(backup, ec);

            if (ec) {
                _logger->warn("failed to remove {}: {}", backup, ec.message());
            }
        }

        return true;
    }

    bool CheckpointStore::restoreFromBackup(const std::string &backup) {
        std::error_code ec;

        if (!fs::exists(backup, ec)) {
            // nothing was persisted before; drop the partial file
            fs::remove(*_path, ec);
            return !ec;
        }

        fs::copy_file(backup, *_path, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            _logger->error("failed to restore {} from {}: {}", *_path, backup, ec.message());
            return false;
        }

        fs::remove(backup, ec);
        if (ec) {
            _logger->warn("failed to remove {}: {}", backup, ec.message());
        }

        _logger->info("restored {} from {}", *_path, backup);
        return true;
    }

    bool CheckpointStore::writeFile(const std::string &path, const std::string &contents) {
        std::ofstream outputStream(path, std::ios::out | std::ios::trunc);
        if (!outputStream.is_open()) {
            return false;
        }

        outputStream << contents;
        outputStream.flush();

        return outputStream.good();
    }

    void CheckpointStore::updateCheckpoint(const std::string &streamId, const std::string &name,
                                           const std::optional<Timestamp> &position) {
        if (!position.has_value()) {
            _logger->debug("no checkpoint to update for {}", name);
            return;
        }

        std::scoped_lock lock(_mutex);

        legacy::migrateKey(_table, streamId);
        _table[name] = *position;

        _logger->debug("checkpoint for {} updated to {}", name, position->toString());
    }

    std::optional<Timestamp> CheckpointStore::readCheckpoint(const std::string &streamId,
                                                             const std::string &name) const {
        std::optional<Timestamp> checkpoint;
        {
            std::scoped_lock lock(_mutex);
            checkpoint = legacy::lookup(_table, streamId, name);
        }

        _logger->debug("reading last checkpoint for {} as {}", name,
                       checkpoint.has_value() ? checkpoint->toString() : "(none)");
        return checkpoint;
    }

    CheckpointTable CheckpointStore::snapshot() const {
        std::scoped_lock lock(_mutex);
        return _table;
    }

    const std::optional<std::string> &CheckpointStore::path() const {
        return _path;
    }

    std::string CheckpointStore::backupPath() const {
        return _path.value_or("") + BACKUP_SUFFIX;
    }
}
