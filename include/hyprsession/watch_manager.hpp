#ifndef HYPRSESSION_WATCH_MANAGER_HPP
#define HYPRSESSION_WATCH_MANAGER_HPP

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "hyprsession/channel.hpp"
#include "hyprsession/change_classifier.hpp"
#include "hyprsession/inotify_source.hpp"

namespace hyprsession {

    enum class WatchState {
        kStopped,
        kStarting,
        kWatching,
        kStopping,
    };

    std::string_view watch_state_name(WatchState state);

    struct WatchStatus {
        std::filesystem::path directory;
        WatchState            state = WatchState::kStopped;
    };

    struct ReconcileResult {
        std::vector<std::filesystem::path> started;
        std::vector<std::filesystem::path> skipped;
        std::vector<std::filesystem::path> missing;
    };

    class WatchManager {
      public:
        WatchManager(BoundedChannel<ChangeEvent>& channel, WatchSourceFactory factory, std::size_t max_watches, int depth);
        ~WatchManager();

        WatchManager(const WatchManager&)            = delete;
        WatchManager& operator=(const WatchManager&) = delete;

        ReconcileResult                    reconcile(const std::vector<std::filesystem::path>& directories);
        std::vector<std::filesystem::path> health_check();
        void                               stop_all();

        std::size_t                        active_count() const;
        std::vector<WatchStatus>           statuses() const;
        std::optional<WatchState>          state(const std::filesystem::path& directory) const;

      private:
        struct Watch {
            std::filesystem::path   directory;
            std::atomic<WatchState> state  = WatchState::kStopped;
            std::atomic<bool>       exited = false;
            std::jthread            worker;
        };

        bool                                                     start(Watch& watch);
        void                                                     stop(Watch& watch);
        std::size_t                                              active_count_locked() const;

        BoundedChannel<ChangeEvent>&                             channel_;
        WatchSourceFactory                                       factory_;
        std::size_t                                              max_watches_;
        int                                                      depth_;
        mutable std::mutex                                       mutex_;
        std::map<std::filesystem::path, std::unique_ptr<Watch>> watches_;
    };

    nlohmann::json           watch_registry_to_json(const std::vector<WatchStatus>& statuses, std::string_view timestamp);
    bool                     write_watch_registry(const std::filesystem::path& path, const std::vector<WatchStatus>& statuses, std::string* error);
    std::vector<WatchStatus> load_watch_registry(const std::filesystem::path& path);

} // namespace hyprsession

#endif // HYPRSESSION_WATCH_MANAGER_HPP
