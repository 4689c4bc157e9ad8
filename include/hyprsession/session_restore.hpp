#ifndef HYPRSESSION_SESSION_RESTORE_HPP
#define HYPRSESSION_SESSION_RESTORE_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

#include "hyprsession/cancellation.hpp"
#include "hyprsession/hooks.hpp"
#include "hyprsession/hyprctl.hpp"
#include "hyprsession/snapshot.hpp"

namespace hyprsession {

    struct RestoreOptions {
        int                       readiness_attempts   = 10;
        std::chrono::milliseconds readiness_backoff    = std::chrono::milliseconds(500);
        std::chrono::milliseconds launch_delay         = std::chrono::milliseconds(2000);
        int                       window_wait_attempts = 30;
        std::chrono::milliseconds window_wait_interval = std::chrono::milliseconds(1000);
        std::chrono::seconds      hook_timeout         = std::chrono::seconds(30);
        std::filesystem::path     state_dir            = {};
        bool                      debug_logging        = false;
    };

    struct RestoreReport {
        int                      workspaces_created    = 0;
        int                      workspaces_failed     = 0;
        int                      applications_launched = 0;
        int                      applications_skipped  = 0;
        int                      applications_failed   = 0;
        int                      windows_appeared      = 0;
        int                      windows_placed        = 0;
        bool                     focus_restored        = false;
        HookSummary              hooks                 = {};
        int                      expected_windows      = 0;
        int                      present_windows       = 0;
        bool                     cancelled             = false;
        std::vector<std::string> warnings              = {};

        bool                     mismatch() const {
            return present_windows < expected_windows;
        }
    };

    std::chrono::milliseconds readiness_delay(std::chrono::milliseconds base, int attempt);

    class SessionRestorer {
      public:
        SessionRestorer(CompositorClient& client, HookPipeline& hooks, Sleeper sleeper, RestoreOptions options, std::stop_token stop = {});

        std::expected<RestoreReport, std::string> restore(const SessionSnapshot& snapshot);

      private:
        std::optional<std::string>     wait_until_ready();
        void                           recreate_workspaces(const SessionSnapshot& snapshot, RestoreReport& report);
        std::vector<ApplicationRecord> launch_applications(const SessionSnapshot& snapshot, const std::vector<WindowInfo>& live, RestoreReport& report);
        void                           wait_for_windows(const std::vector<ApplicationRecord>& launched, const std::set<std::string>& existing, RestoreReport& report);
        void                           place_windows(const SessionSnapshot& snapshot, const std::set<std::string>& existing, RestoreReport& report);
        void                           restore_focus(const SessionSnapshot& snapshot, RestoreReport& report);
        void                           validate(const SessionSnapshot& snapshot, RestoreReport& report);

        CompositorClient&              client_;
        HookPipeline&                  hooks_;
        Sleeper                        sleeper_;
        RestoreOptions                 options_;
        std::stop_token                stop_;
    };

} // namespace hyprsession

#endif // HYPRSESSION_SESSION_RESTORE_HPP
