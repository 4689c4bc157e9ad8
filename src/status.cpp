#include "hyprsession/status.hpp"

#include <algorithm>
#include <sstream>

#include <nlohmann/json.hpp>

namespace hyprsession {

    namespace {

        std::string enabled_label(bool value) {
            return value ? "enabled" : "disabled";
        }

    } // namespace

    std::string render_session_status(const SessionStatus& status) {
        std::ostringstream output;
        output << "Session: " << (status.snapshot.exists ? "saved" : "none") << "\n";
        if (status.snapshot.exists) {
            output << "Last saved: " << (status.snapshot.timestamp.empty() ? "unknown" : status.snapshot.timestamp) << "\n";
            output << "Snapshot: " << status.snapshot.id << "\n";
            output << "Files: " << status.snapshot.file_count << "\n";
            output << "Location: " << status.snapshot.directory.string() << "\n";
        }
        output << "Hooks: " << status.pre_save_hooks << " pre-save, " << status.post_restore_hooks << " post-restore\n";
        return output.str();
    }

    std::string render_session_status_json(const SessionStatus& status) {
        nlohmann::json snapshot = nullptr;
        if (status.snapshot.exists) {
            snapshot = nlohmann::json{
                {"id", status.snapshot.id},
                {"timestamp", status.snapshot.timestamp},
                {"file_count", status.snapshot.file_count},
                {"directory", status.snapshot.directory.string()},
            };
        }
        nlohmann::json json{
            {"saved", status.snapshot.exists},
            {"snapshot", snapshot},
            {"hooks", nlohmann::json{{"pre_save", status.pre_save_hooks}, {"post_restore", status.post_restore_hooks}}},
        };
        return json.dump();
    }

    std::string render_daemon_status(const DaemonStatus& status) {
        std::ostringstream output;
        output << "Daemon: " << (status.running ? "RUNNING" : "STOPPED");
        if (status.running && status.pid) {
            output << " (pid " << *status.pid << ")";
        }
        output << "\n";

        const auto active = std::ranges::count_if(status.watches, [](const WatchStatus& watch) { return watch.state == WatchState::kWatching || watch.state == WatchState::kStarting; });
        output << "Watches: " << (status.running ? active : 0) << " active\n";
        if (status.running) {
            for (const auto& watch : status.watches) {
                output << "  " << watch.directory.string() << " (" << watch_state_name(watch.state) << ")\n";
            }
        }

        output << "Baseline: ";
        if (status.baseline_established) {
            output << "established, " << status.environment_count << " environments\n";
        } else {
            output << "not established\n";
        }
        output << "Config: " << status.config_path.string() << (status.config_present ? "" : " (defaults)") << "\n";
        output << "Auto-save: " << enabled_label(status.auto_save_enabled) << " (threshold " << status.impact_threshold << ")\n";
        output << "Notifications: " << enabled_label(status.notifications_enabled) << "\n";
        output << "Scan interval: " << status.scan_interval.count() << "s\n";
        return output.str();
    }

} // namespace hyprsession
