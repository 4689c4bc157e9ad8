#include "hyprsession/runtime.hpp"

#include <sstream>

#include <unistd.h>

#include "hyprsession/daemon.hpp"
#include "hyprsession/environments.hpp"
#include "hyprsession/inotify_source.hpp"
#include "hyprsession/ipc_socket.hpp"
#include "hyprsession/logging.hpp"

namespace hyprsession {

    namespace {

        std::string hook_label(const HookSummary& summary) {
            return std::to_string(summary.succeeded) + "/" + std::to_string(summary.total);
        }

        CommandOutput from_expected(const std::expected<std::string, std::string>& result) {
            if (!result) {
                return CommandOutput{false, result.error()};
            }
            return CommandOutput{true, *result};
        }

    } // namespace

    RuntimeConfig load_runtime_config(const Paths& paths) {
        return RuntimeConfig{
            .paths  = paths,
            .config = load_config(paths.config_path),
        };
    }

    std::unique_ptr<HyprctlInvoker> make_invoker_from_env() {
        if (const auto socket = resolve_hyprland_socket_from_env()) {
            return std::make_unique<HyprlandSocketInvoker>(*socket);
        }
        return std::make_unique<UnavailableInvoker>("DependencyMissing: HYPRLAND_INSTANCE_SIGNATURE not set");
    }

    RestoreOptions restore_options_from(const Config& config) {
        return RestoreOptions{
            .readiness_attempts   = config.readiness_attempts,
            .readiness_backoff    = config.readiness_backoff,
            .launch_delay         = std::chrono::duration_cast<std::chrono::milliseconds>(config.launch_delay),
            .window_wait_attempts = config.window_wait_attempts,
            .window_wait_interval = config.window_wait_interval,
            .hook_timeout         = config.hook_timeout,
            .state_dir            = {},
            .debug_logging        = config.debug_logging,
        };
    }

    SessionServices::SessionServices(const RuntimeConfig& runtime, HyprctlInvoker& invoker, HookRunner& runner) :
        runtime_(runtime), client_(invoker), store_(runtime.paths.session_dir, runtime.config.keep_snapshots), registry_(), pipeline_(registry_, runner),
        capturer_(client_, store_, pipeline_,
                  CaptureOptions{
                      .proc_root    = runtime.paths.proc_root,
                      .lock_path    = runtime.paths.save_lock_path,
                      .hook_timeout = runtime.config.hook_timeout,
                  }) {
        registry_.discover(runtime.paths.hooks_dir);
    }

    std::expected<CaptureResult, std::string> SessionServices::save(std::stop_token stop) {
        return capturer_.capture(std::move(stop));
    }

    std::expected<RestoreReport, std::string> SessionServices::restore(std::stop_token stop, Sleeper sleeper) {
        std::string error;
        const auto  snapshot = store_.load_current(&error);
        if (!snapshot) {
            return std::unexpected(error.empty() ? std::string("no saved session") : error);
        }
        auto options      = restore_options_from(runtime_.config);
        options.state_dir = store_.current_directory().value_or(store_.root());
        if (!sleeper) {
            sleeper = make_sleeper(stop);
        }
        SessionRestorer restorer(client_, pipeline_, std::move(sleeper), std::move(options), stop);
        return restorer.restore(*snapshot);
    }

    SessionStatus SessionServices::status() const {
        return SessionStatus{
            .snapshot           = store_.status(),
            .pre_save_hooks     = registry_.executable_count(HookPhase::kPreSave),
            .post_restore_hooks = registry_.executable_count(HookPhase::kPostRestore),
        };
    }

    std::optional<std::string> SessionServices::clean() {
        return store_.clean(runtime_.paths.save_lock_path);
    }

    std::string format_capture_result(const CaptureResult& result) {
        return "saved " + result.id + " (" + std::to_string(result.window_count) + " windows, " + std::to_string(result.application_count) + " applications, hooks " +
            hook_label(result.hooks) + ")";
    }

    std::string format_restore_report(const RestoreReport& report) {
        std::ostringstream output;
        output << "workspaces " << report.workspaces_created;
        if (report.workspaces_failed > 0) {
            output << " (" << report.workspaces_failed << " failed)";
        }
        output << ", launched " << report.applications_launched << " (" << report.applications_skipped << " already running, " << report.applications_failed << " failed)";
        output << ", placed " << report.windows_placed << ", windows " << report.present_windows << "/" << report.expected_windows;
        output << ", hooks " << hook_label(report.hooks);
        for (const auto& warning : report.warnings) {
            output << "\nwarning: " << warning;
        }
        return output.str();
    }

    int run_daemon(const RuntimeConfig& runtime, HyprctlInvoker& invoker) {
        const auto& paths = runtime.paths;
        const int   pid   = static_cast<int>(::getpid());
        if (const auto other = running_daemon_pid(paths.pid_path); other && *other != pid) {
            error_log("daemon", "already running (pid " + std::to_string(*other) + ")");
            return 1;
        }

        std::stop_source stop;
        SignalStopper    signals(stop);
        std::string      error;
        if (!write_pid_file(paths.pid_path, pid, &error)) {
            error_log("daemon", "unable to write pid file: " + error);
            return 1;
        }

        NotifySendNotifier notifier(runtime.config.notifications_enabled);
        ProcessHookRunner  runner;
        SessionServices    services(runtime, invoker, runner);
        SaveAction         save = [&services, token = stop.get_token()]() -> std::optional<std::string> {
            const auto result = services.save(token);
            if (!result) {
                return result.error();
            }
            info_log("daemon", format_capture_result(*result));
            return std::nullopt;
        };

        {
            Daemon daemon(
                DaemonSettings{
                    .paths            = paths,
                    .config           = runtime.config,
                    .scan             = make_scan_options(runtime.config, paths.home_dir, scan_env_from_process()),
                    .channel_capacity = 256,
                },
                std::move(save), notifier, inotify_source_factory());
            daemon.run(stop.get_token());
        }
        remove_pid_file(paths.pid_path, pid);
        return 0;
    }

    CommandOutput run_command(const RuntimeConfig& runtime, const Command& command, SessionServices& services, Notifier& notifier, const DaemonEntry& daemon_entry) {
        const auto& paths = runtime.paths;
        switch (command.kind) {
            case CommandKind::kHelp: return CommandOutput{true, usage_text()};
            case CommandKind::kSave: {
                const auto result = services.save();
                if (!result) {
                    notifier.notify(session_notification(SessionAction::kSave, false, result.error()));
                    return CommandOutput{false, result.error()};
                }
                notifier.notify(session_notification(SessionAction::kSave, true, result->id));
                return CommandOutput{true, "Session " + format_capture_result(*result)};
            }
            case CommandKind::kRestore: {
                const auto report = services.restore();
                if (!report) {
                    notifier.notify(session_notification(SessionAction::kRestore, false, report.error()));
                    return CommandOutput{false, report.error()};
                }
                if (report->cancelled) {
                    return CommandOutput{false, "restore cancelled: " + format_restore_report(*report)};
                }
                notifier.notify(session_notification(SessionAction::kRestore, true, report->mismatch() ? "some windows missing" : ""));
                return CommandOutput{true, "Session restored: " + format_restore_report(*report)};
            }
            case CommandKind::kStatus: {
                const auto status = services.status();
                return CommandOutput{true, command.json ? render_session_status_json(status) : render_session_status(status)};
            }
            case CommandKind::kClean: {
                if (const auto error = services.clean()) {
                    return CommandOutput{false, *error};
                }
                return CommandOutput{true, "Session store removed: " + paths.session_dir.string()};
            }
            case CommandKind::kDaemonStart:
            case CommandKind::kDaemonRestart: {
                if (command.kind == CommandKind::kDaemonRestart) {
                    if (const auto stopped = stop_daemon(paths); !stopped) {
                        return CommandOutput{false, stopped.error()};
                    }
                }
                const DaemonEntry background = [&paths, &daemon_entry] {
                    if (!install_daemon_log_sink(paths.daemon_log_path)) {
                        clear_log_sink();
                    }
                    const int code = daemon_entry ? daemon_entry() : 1;
                    close_daemon_log_sink();
                    return code;
                };
                return from_expected(start_daemon(paths, command.force, background));
            }
            case CommandKind::kDaemonStop: return from_expected(stop_daemon(paths));
            case CommandKind::kDaemonStatus: return CommandOutput{true, render_daemon_status(collect_daemon_status(paths, runtime.config))};
            case CommandKind::kDaemonRun: {
                if (!daemon_entry) {
                    return CommandOutput{false, "daemon unavailable"};
                }
                const int code = daemon_entry();
                return CommandOutput{code == 0, code == 0 ? "daemon stopped" : "daemon failed"};
            }
        }
        return CommandOutput{false, "unknown command"};
    }

} // namespace hyprsession
