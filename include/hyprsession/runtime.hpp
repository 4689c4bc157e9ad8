#ifndef HYPRSESSION_RUNTIME_HPP
#define HYPRSESSION_RUNTIME_HPP

#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "hyprsession/cancellation.hpp"
#include "hyprsession/command.hpp"
#include "hyprsession/config.hpp"
#include "hyprsession/daemon_control.hpp"
#include "hyprsession/hooks.hpp"
#include "hyprsession/hyprctl.hpp"
#include "hyprsession/notifications.hpp"
#include "hyprsession/paths.hpp"
#include "hyprsession/session_capture.hpp"
#include "hyprsession/session_restore.hpp"
#include "hyprsession/snapshot_store.hpp"
#include "hyprsession/status.hpp"

namespace hyprsession {

    struct RuntimeConfig {
        Paths  paths;
        Config config;
    };

    struct CommandOutput {
        bool        success;
        std::string output;
    };

    RuntimeConfig                   load_runtime_config(const Paths& paths);
    std::unique_ptr<HyprctlInvoker> make_invoker_from_env();
    RestoreOptions                  restore_options_from(const Config& config);

    class SessionServices {
      public:
        SessionServices(const RuntimeConfig& runtime, HyprctlInvoker& invoker, HookRunner& runner);

        SessionServices(const SessionServices&)            = delete;
        SessionServices& operator=(const SessionServices&) = delete;

        std::expected<CaptureResult, std::string> save(std::stop_token stop = {});
        std::expected<RestoreReport, std::string> restore(std::stop_token stop = {}, Sleeper sleeper = {});
        SessionStatus                             status() const;
        std::optional<std::string>                clean();

      private:
        const RuntimeConfig& runtime_;
        HyprctlClient        client_;
        SnapshotStore        store_;
        HookRegistry         registry_;
        HookPipeline         pipeline_;
        SessionCapturer      capturer_;
    };

    std::string   format_capture_result(const CaptureResult& result);
    std::string   format_restore_report(const RestoreReport& report);

    int           run_daemon(const RuntimeConfig& runtime, HyprctlInvoker& invoker);

    CommandOutput run_command(const RuntimeConfig& runtime, const Command& command, SessionServices& services, Notifier& notifier, const DaemonEntry& daemon_entry);

} // namespace hyprsession

#endif // HYPRSESSION_RUNTIME_HPP
