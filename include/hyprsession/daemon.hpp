#ifndef HYPRSESSION_DAEMON_HPP
#define HYPRSESSION_DAEMON_HPP

#include <cstddef>
#include <stop_token>
#include <vector>

#include "hyprsession/auto_save.hpp"
#include "hyprsession/baseline.hpp"
#include "hyprsession/channel.hpp"
#include "hyprsession/config.hpp"
#include "hyprsession/environments.hpp"
#include "hyprsession/inotify_source.hpp"
#include "hyprsession/notifications.hpp"
#include "hyprsession/paths.hpp"
#include "hyprsession/watch_manager.hpp"

namespace hyprsession {

    struct DaemonSettings {
        Paths       paths;
        Config      config;
        ScanOptions scan;
        std::size_t channel_capacity = 256;
    };

    struct CycleReport {
        std::vector<std::filesystem::path> restarted_watches;
        ReconcileResult                    reconcile;
        BaselineCycleResult                baseline;
        std::optional<TriggerDecision>     flushed;
    };

    class Daemon {
      public:
        Daemon(DaemonSettings settings, SaveAction save, Notifier& notifier, WatchSourceFactory factory);
        ~Daemon();

        Daemon(const Daemon&)            = delete;
        Daemon& operator=(const Daemon&) = delete;

        void        run(std::stop_token stop);
        CycleReport run_cycle();

        std::size_t drain_events();

        WatchManager& watches() {
            return watches_;
        }

      private:
        void                        handle_event(ChangeEvent event);
        void                        classifier_loop(std::stop_token stop);

        DaemonSettings              settings_;
        BoundedChannel<ChangeEvent> channel_;
        WatchManager                watches_;
        BaselineTracker             baseline_;
        AutoSaveTrigger             trigger_;
    };

    AutoSaveSettings auto_save_settings_from(const Config& config, const Paths& paths);

} // namespace hyprsession

#endif // HYPRSESSION_DAEMON_HPP
