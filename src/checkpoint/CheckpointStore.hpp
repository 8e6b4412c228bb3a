//
// Per-stream replication checkpoints, persisted to a JSON file
//

#ifndef OPLOGSYNC_CHECKPOINT_CHECKPOINTSTORE_HPP
#define OPLOGSYNC_CHECKPOINT_CHECKPOINTSTORE_HPP

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "utils/log.hpp"

#include "LegacyCheckpointFormat.hpp"
#include "Timestamp.hpp"

namespace oplogsync::checkpoint {
    /**
     * thrown by CheckpointStore::save() when the new file could not be written
     * and the previous content could not be restored from the backup either.
     */
    class CheckpointPersistenceError: public std::runtime_error {
    public:
        explicit CheckpointPersistenceError(const std::string &message):
            std::runtime_error(message)
        {
        }
    };

    /**
     * stream name -> last applied position.
     *
     * shared by every tailer worker; load() runs once before the workers start,
     * save() runs periodically and at shutdown. save() writes a snapshot outside
     * the table lock, so updates are never blocked on file I/O.
     *
     * without a file path, load() and save() do nothing.
     */
    class CheckpointStore {
    public:
        static constexpr const char *BACKUP_SUFFIX = ".backup";

        explicit CheckpointStore(std::optional<std::string> path = std::nullopt);
        virtual ~CheckpointStore() = default;

        /**
         * reads the checkpoint file into the table.
         * a missing, empty or corrupt file leaves the table empty; this never throws.
         * if the file is missing or empty but a backup from an interrupted save() exists,
         * the backup is read instead.
         */
        void load();

        /**
         * moves the current file to <path>.backup, writes the table to <path> and
         * removes the backup. if writing fails, <path> is restored from the backup.
         *
         * @return false if the table could not be written and the previous file was restored
         * @throws CheckpointPersistenceError if restoring the previous file failed as well
         */
        bool save();

        /**
         * records `position` for stream `name`; an empty position is ignored.
         * an entry still keyed by `streamId` (old key scheme) is removed.
         */
        void updateCheckpoint(const std::string &streamId, const std::string &name,
                              const std::optional<Timestamp> &position);

        std::optional<Timestamp> readCheckpoint(const std::string &streamId, const std::string &name) const;

        CheckpointTable snapshot() const;

        const std::optional<std::string> &path() const;
        std::string backupPath() const;

    protected:
        virtual bool writeFile(const std::string &path, const std::string &contents);

    private:
        bool restoreFromBackup(const std::string &backup);

        LoggerPtr _logger;
        std::optional<std::string> _path;

        mutable std::mutex _mutex;
        std::mutex _saveMutex;

        CheckpointTable _table;
        bool _isLoaded;
    };
}

#endif //OPLOGSYNC_CHECKPOINT_CHECKPOINTSTORE_HPP
