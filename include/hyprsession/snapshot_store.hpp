#ifndef HYPRSESSION_SNAPSHOT_STORE_HPP
#define HYPRSESSION_SNAPSHOT_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "hyprsession/snapshot.hpp"

namespace hyprsession {

    struct SnapshotStatus {
        bool                  exists     = false;
        std::string           id         = {};
        std::string           timestamp  = {};
        int                   file_count = 0;
        std::filesystem::path directory  = {};
    };

    class SnapshotStore {
      public:
        SnapshotStore(std::filesystem::path root, int keep_snapshots);

        std::optional<std::filesystem::path> write(const SessionSnapshot& snapshot, std::string* error);
        std::optional<SessionSnapshot>       load_current(std::string* error) const;
        std::optional<std::filesystem::path> current_directory() const;
        SnapshotStatus                       status() const;
        std::optional<std::string>           clean(const std::filesystem::path& lock_path);

        const std::filesystem::path&         root() const {
            return root_;
        }

      private:
        void                  prune(const std::filesystem::path& keep_dir);

        std::filesystem::path root_;
        int                   keep_snapshots_;
    };

} // namespace hyprsession

#endif // HYPRSESSION_SNAPSHOT_STORE_HPP
