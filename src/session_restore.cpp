#include "hyprsession/session_restore.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

#include "hyprsession/logging.hpp"

namespace hyprsession {

    namespace {

        constexpr auto kMaxReadinessDelay = std::chrono::milliseconds(8000);

        void           add_warning(RestoreReport& report, std::string message) {
            warn_log("restore", message);
            report.warnings.push_back(std::move(message));
        }

        std::map<std::string, int> count_new_by_class(const std::vector<WindowInfo>& windows, const std::set<std::string>& existing) {
            std::map<std::string, int> counts;
            for (const auto& window : windows) {
                if (window.class_name && !existing.contains(window.address)) {
                    ++counts[*window.class_name];
                }
            }
            return counts;
        }

        enum class MatchLevel {
            kWorkspaceAndTitle,
            kWorkspace,
            kTitle,
            kClass,
        };

        bool matches_at(const WindowInfo& saved, const WindowInfo& candidate, MatchLevel level) {
            if (candidate.class_name != saved.class_name) {
                return false;
            }
            switch (level) {
                case MatchLevel::kWorkspaceAndTitle: return candidate.workspace_id == saved.workspace_id && candidate.title == saved.title;
                case MatchLevel::kWorkspace: return candidate.workspace_id == saved.workspace_id;
                case MatchLevel::kTitle: return candidate.title == saved.title;
                case MatchLevel::kClass: return true;
            }
            return false;
        }

    } // namespace

    std::chrono::milliseconds readiness_delay(std::chrono::milliseconds base, int attempt) {
        auto delay = base;
        for (int i = 0; i < attempt && delay < kMaxReadinessDelay; ++i) {
            delay *= 2;
        }
        return std::min(delay, kMaxReadinessDelay);
    }

    SessionRestorer::SessionRestorer(CompositorClient& client, HookPipeline& hooks, Sleeper sleeper, RestoreOptions options, std::stop_token stop) :
        client_(client), hooks_(hooks), sleeper_(std::move(sleeper)), options_(std::move(options)), stop_(std::move(stop)) {}

    std::expected<RestoreReport, std::string> SessionRestorer::restore(const SessionSnapshot& snapshot) {
        if (const auto error = wait_until_ready()) {
            error_log("restore", *error);
            return std::unexpected(*error);
        }

        RestoreReport report;
        report.expected_windows = static_cast<int>(snapshot.windows.size());

        recreate_workspaces(snapshot, report);
        std::vector<WindowInfo> before;
        if (auto live = client_.windows()) {
            before = std::move(*live);
        }
        std::set<std::string> existing;
        for (const auto& window : before) {
            existing.insert(window.address);
        }

        const auto launched = launch_applications(snapshot, before, report);
        if (!report.cancelled) {
            wait_for_windows(launched, existing, report);
        }
        if (!report.cancelled) {
            place_windows(snapshot, existing, report);
            restore_focus(snapshot, report);
        }
        report.hooks = hooks_.run(HookPhase::kPostRestore, HookContext{.state_dir = options_.state_dir, .timeout = options_.hook_timeout, .stop = stop_});
        validate(snapshot, report);
        return report;
    }

    std::optional<std::string> SessionRestorer::wait_until_ready() {
        const int   attempts = std::max(1, options_.readiness_attempts);
        std::string last_error;
        for (int attempt = 0; attempt < attempts; ++attempt) {
            const auto ready = client_.active_workspace_id();
            if (ready) {
                return std::nullopt;
            }
            last_error = format_compositor_error(ready.error());
            debug_log(options_.debug_logging, "restore", "compositor not ready (attempt " + std::to_string(attempt + 1) + "): " + last_error);
            if (attempt + 1 < attempts && !sleeper_(readiness_delay(options_.readiness_backoff, attempt))) {
                return "restore cancelled while waiting for compositor";
            }
        }
        return "CompositorUnreachable: " + last_error;
    }

    void SessionRestorer::recreate_workspaces(const SessionSnapshot& snapshot, RestoreReport& report) {
        for (const auto& workspace : snapshot.workspaces) {
            if (workspace.id <= 0) {
                continue;
            }
            if (const auto result = client_.dispatch(focus_workspace_command(workspace.id)); !result) {
                ++report.workspaces_failed;
                add_warning(report, "workspace " + std::to_string(workspace.id) + ": " + format_compositor_error(result.error()));
                continue;
            }
            if (workspace.name && *workspace.name != std::to_string(workspace.id)) {
                if (const auto result = client_.dispatch(rename_workspace_command(workspace.id, *workspace.name)); !result) {
                    add_warning(report, "rename workspace " + std::to_string(workspace.id) + ": " + format_compositor_error(result.error()));
                }
            }
            ++report.workspaces_created;
        }
    }

    std::vector<ApplicationRecord> SessionRestorer::launch_applications(const SessionSnapshot& snapshot, const std::vector<WindowInfo>& live, RestoreReport& report) {
        std::set<std::pair<std::string, int>> running;
        for (const auto& window : live) {
            if (window.class_name) {
                running.insert({*window.class_name, window.workspace_id});
            }
        }

        std::vector<ApplicationRecord> launched;
        for (const auto& application : snapshot.applications) {
            if (running.contains({application.class_name, application.workspace_id})) {
                ++report.applications_skipped;
                continue;
            }
            if (!launched.empty() && !sleeper_(options_.launch_delay)) {
                report.cancelled = true;
                add_warning(report, "restore cancelled during application launch");
                break;
            }
            if (const auto result = client_.dispatch(exec_on_workspace_command(application.workspace_id, application.command)); !result) {
                ++report.applications_failed;
                add_warning(report, "launch " + application.class_name + ": " + format_compositor_error(result.error()));
                continue;
            }
            ++report.applications_launched;
            info_log("restore", "launched " + application.class_name + " on workspace " + std::to_string(application.workspace_id));
            launched.push_back(application);
        }
        return launched;
    }

    void SessionRestorer::wait_for_windows(const std::vector<ApplicationRecord>& launched, const std::set<std::string>& existing, RestoreReport& report) {
        std::map<std::string, int> pending;
        for (const auto& application : launched) {
            ++pending[application.class_name];
        }
        const int attempts = std::max(1, options_.window_wait_attempts);
        for (int attempt = 0; attempt < attempts && !pending.empty(); ++attempt) {
            if (const auto live = client_.windows()) {
                const auto present = count_new_by_class(*live, existing);
                for (auto it = pending.begin(); it != pending.end();) {
                    const auto found = present.find(it->first);
                    if (found != present.end() && found->second >= it->second) {
                        report.windows_appeared += it->second;
                        it = pending.erase(it);
                        continue;
                    }
                    ++it;
                }
            }
            if (pending.empty() || attempt + 1 == attempts) {
                break;
            }
            if (!sleeper_(options_.window_wait_interval)) {
                report.cancelled = true;
                add_warning(report, "restore cancelled while waiting for windows");
                return;
            }
        }
        for (const auto& [class_name, count] : pending) {
            add_warning(report, "window for " + class_name + " did not appear");
        }
    }

    void SessionRestorer::place_windows(const SessionSnapshot& snapshot, const std::set<std::string>& existing, RestoreReport& report) {
        const auto live = client_.windows();
        if (!live) {
            add_warning(report, "unable to list windows for placement: " + format_compositor_error(live.error()));
            return;
        }

        std::vector<const WindowInfo*> candidates;
        for (const auto& window : *live) {
            if (!existing.contains(window.address)) {
                candidates.push_back(&window);
            }
        }
        for (const auto& window : *live) {
            if (existing.contains(window.address)) {
                candidates.push_back(&window);
            }
        }

        std::vector<const WindowInfo*> matches(snapshot.windows.size(), nullptr);
        std::set<std::string>          used;
        for (const auto level : {MatchLevel::kWorkspaceAndTitle, MatchLevel::kWorkspace, MatchLevel::kTitle, MatchLevel::kClass}) {
            for (size_t i = 0; i < snapshot.windows.size(); ++i) {
                const auto& saved = snapshot.windows[i];
                if (matches[i] || !saved.class_name) {
                    continue;
                }
                for (const auto* candidate : candidates) {
                    if (!used.contains(candidate->address) && matches_at(saved, *candidate, level)) {
                        matches[i] = candidate;
                        used.insert(candidate->address);
                        break;
                    }
                }
            }
        }

        for (size_t i = 0; i < snapshot.windows.size(); ++i) {
            if (!matches[i]) {
                continue;
            }
            const auto& saved = snapshot.windows[i];
            if (const auto result = client_.dispatch_batch(place_window_sequence(saved, matches[i]->address)); !result) {
                add_warning(report, "place " + *saved.class_name + ": " + format_compositor_error(result.error()));
                continue;
            }
            ++report.windows_placed;
        }
    }

    void SessionRestorer::restore_focus(const SessionSnapshot& snapshot, RestoreReport& report) {
        const auto result = client_.dispatch(focus_workspace_command(snapshot.active_workspace_id));
        if (!result) {
            add_warning(report, "focus workspace " + std::to_string(snapshot.active_workspace_id) + ": " + format_compositor_error(result.error()));
            return;
        }
        report.focus_restored = true;
    }

    void SessionRestorer::validate(const SessionSnapshot& snapshot, RestoreReport& report) {
        const auto live = client_.windows();
        if (!live) {
            add_warning(report, "unable to count windows: " + format_compositor_error(live.error()));
            return;
        }
        report.present_windows = static_cast<int>(live->size());
        if (report.mismatch()) {
            add_warning(report, "RestoreMismatch: expected " + std::to_string(snapshot.windows.size()) + " windows, found " + std::to_string(report.present_windows));
        }
    }

} // namespace hyprsession
