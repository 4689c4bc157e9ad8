#ifndef HYPRSESSION_DAEMON_CONTROL_HPP
#define HYPRSESSION_DAEMON_CONTROL_HPP

#include <atomic>
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "hyprsession/config.hpp"
#include "hyprsession/paths.hpp"
#include "hyprsession/status.hpp"

namespace hyprsession {

    std::optional<int> read_pid_file(const std::filesystem::path& path);
    bool               write_pid_file(const std::filesystem::path& path, int pid, std::string* error);
    void               remove_pid_file(const std::filesystem::path& path, int pid);

    std::optional<int> running_daemon_pid(const std::filesystem::path& path);

    DaemonStatus       collect_daemon_status(const Paths& paths, const Config& config);

    using DaemonEntry = std::function<int()>;

    std::expected<std::string, std::string> start_daemon(const Paths& paths, bool force, const DaemonEntry& entry);
    std::expected<std::string, std::string> stop_daemon(const Paths& paths, std::chrono::milliseconds timeout = std::chrono::seconds(5));

    class SignalStopper {
      public:
        explicit SignalStopper(std::stop_source source);
        ~SignalStopper();

        SignalStopper(const SignalStopper&)            = delete;
        SignalStopper& operator=(const SignalStopper&) = delete;

      private:
        std::stop_source  source_;
        std::atomic<bool> finished_ = false;
        std::jthread      thread_;
    };

    bool install_daemon_log_sink(const std::filesystem::path& path);
    void close_daemon_log_sink();

} // namespace hyprsession

#endif // HYPRSESSION_DAEMON_CONTROL_HPP
