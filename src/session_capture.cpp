#include "hyprsession/session_capture.hpp"

#include <utility>

#include "hyprsession/clock.hpp"
#include "hyprsession/logging.hpp"
#include "hyprsession/save_lock.hpp"

namespace hyprsession {

    std::expected<SessionSnapshot, std::string> collect_snapshot(CompositorClient& client, const std::filesystem::path& proc_root) {
        const auto active = client.active_workspace_id();
        if (!active) {
            return std::unexpected(format_compositor_error(active.error()));
        }
        auto monitors = client.monitors();
        if (!monitors) {
            return std::unexpected(format_compositor_error(monitors.error()));
        }
        auto workspaces = client.workspaces();
        if (!workspaces) {
            return std::unexpected(format_compositor_error(workspaces.error()));
        }
        auto windows = client.windows();
        if (!windows) {
            return std::unexpected(format_compositor_error(windows.error()));
        }

        const auto      now = std::chrono::system_clock::now();
        SessionSnapshot snapshot{
            .id                  = format_snapshot_id(now),
            .timestamp           = format_timestamp(now),
            .monitors            = std::move(*monitors),
            .workspaces          = std::move(*workspaces),
            .windows             = std::move(*windows),
            .active_workspace_id = *active,
            .applications        = {},
        };
        snapshot.applications = derive_applications(snapshot.windows, proc_root);
        if (const auto invalid = validate_snapshot(snapshot)) {
            return std::unexpected(*invalid);
        }
        return snapshot;
    }

    SessionCapturer::SessionCapturer(CompositorClient& client, SnapshotStore& store, HookPipeline& hooks, CaptureOptions options) :
        client_(client), store_(store), hooks_(hooks), options_(std::move(options)) {}

    std::expected<CaptureResult, std::string> SessionCapturer::capture(std::stop_token stop) {
        std::lock_guard guard(mutex_);
        auto            lock = SaveLock::acquire(options_.lock_path);
        if (!lock) {
            return std::unexpected("CaptureFailure: " + lock.error());
        }

        const auto snapshot = collect_snapshot(client_, options_.proc_root);
        if (!snapshot) {
            error_log("capture", "CaptureFailure: " + snapshot.error() + ", previous snapshot kept");
            return std::unexpected("CaptureFailure: " + snapshot.error());
        }

        std::string error;
        const auto  directory = store_.write(*snapshot, &error);
        if (!directory) {
            error_log("capture", "CaptureFailure: " + error + ", previous snapshot kept");
            return std::unexpected("CaptureFailure: " + error);
        }
        info_log("capture", "saved snapshot " + directory->filename().string() + " (" + std::to_string(snapshot->windows.size()) + " windows, " +
                     std::to_string(snapshot->applications.size()) + " applications)");

        const auto hooks = hooks_.run(HookPhase::kPreSave, HookContext{.state_dir = *directory, .timeout = options_.hook_timeout, .stop = stop});
        return CaptureResult{
            .id                = directory->filename().string(),
            .directory         = *directory,
            .window_count      = static_cast<int>(snapshot->windows.size()),
            .application_count = static_cast<int>(snapshot->applications.size()),
            .hooks             = hooks,
        };
    }

} // namespace hyprsession
