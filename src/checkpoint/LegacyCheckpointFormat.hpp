//
// Compatibility with checkpoint files and keys written by older releases
//

#ifndef OPLOGSYNC_CHECKPOINT_LEGACYCHECKPOINTFORMAT_HPP
#define OPLOGSYNC_CHECKPOINT_LEGACYCHECKPOINTFORMAT_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "Timestamp.hpp"

namespace oplogsync::checkpoint {
    using CheckpointTable = std::map<std::string, Timestamp>;

    namespace legacy {
        /**
         * parses a checkpoint document.
         *   [name, position]                      single stream (old format)
         *   [[name, position], [name, position]]  one entry per stream
         *
         * @return std::nullopt if the document has neither shape
         */
        std::optional<std::vector<std::pair<std::string, Timestamp>>> parseDocument(const nlohmann::json &document);

        /**
         * a single entry is written in the old single-pair form so older readers still understand it.
         */
        nlohmann::json toDocument(const std::vector<std::pair<std::string, Timestamp>> &entries);

        /**
         * old releases keyed checkpoints by stream id instead of stream name.
         */
        std::string legacyKey(const std::string &streamId);

        /**
         * drops the stream-id keyed entry once the stream writes under its name.
         */
        void migrateKey(CheckpointTable &table, const std::string &streamId);

        std::optional<Timestamp> lookup(const CheckpointTable &table, const std::string &streamId, const std::string &name);
    }
}

#endif //OPLOGSYNC_CHECKPOINT_LEGACYCHECKPOINTFORMAT_HPP
