#ifndef HYPRSESSION_STATUS_HPP
#define HYPRSESSION_STATUS_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "hyprsession/snapshot_store.hpp"
#include "hyprsession/watch_manager.hpp"

namespace hyprsession {

    struct SessionStatus {
        SnapshotStatus snapshot;
        int            pre_save_hooks     = 0;
        int            post_restore_hooks = 0;
    };

    struct DaemonStatus {
        bool                     running               = false;
        std::optional<int>       pid                   = std::nullopt;
        std::vector<WatchStatus> watches               = {};
        bool                     baseline_established  = false;
        int                      environment_count     = 0;
        std::filesystem::path    config_path           = {};
        bool                     config_present        = false;
        bool                     auto_save_enabled     = true;
        bool                     notifications_enabled = true;
        int                      impact_threshold      = 2;
        std::chrono::seconds     scan_interval         = std::chrono::seconds(60);
    };

    std::string render_session_status(const SessionStatus& status);
    std::string render_session_status_json(const SessionStatus& status);
    std::string render_daemon_status(const DaemonStatus& status);

} // namespace hyprsession

#endif // HYPRSESSION_STATUS_HPP
