#include "hyprsession/daemon_control.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>

#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "hyprsession/baseline.hpp"
#include "hyprsession/clock.hpp"
#include "hyprsession/json_utils.hpp"
#include "hyprsession/logging.hpp"
#include "hyprsession/process_utils.hpp"
#include "hyprsession/strings.hpp"
#include "hyprsession/watch_manager.hpp"

namespace hyprsession {

    namespace {

        constexpr auto kPollInterval = std::chrono::milliseconds(100);
        constexpr auto kStartTimeout = std::chrono::seconds(5);

        std::FILE*     daemon_log = nullptr;
        std::mutex     daemon_log_mutex;

        void           daemon_log_sink(std::string_view message) {
            std::lock_guard lock(daemon_log_mutex);
            if (!daemon_log) {
                return;
            }
            const auto timestamp = current_timestamp();
            std::fprintf(daemon_log, "%s %.*s\n", timestamp.c_str(), static_cast<int>(message.size()), message.data());
            std::fflush(daemon_log);
        }

        sigset_t stop_signals() {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGINT);
            sigaddset(&set, SIGTERM);
            return set;
        }

        bool wait_for_exit(int pid, std::chrono::milliseconds timeout) {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (is_process_alive(pid)) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    return false;
                }
                std::this_thread::sleep_for(kPollInterval);
            }
            return true;
        }

        [[noreturn]] void become_daemon(const DaemonEntry& entry) {
            ::setsid();
            const pid_t pid = ::fork();
            if (pid < 0) {
                ::_exit(1);
            }
            if (pid > 0) {
                ::_exit(0);
            }
            if (!std::freopen("/dev/null", "r", stdin) || !std::freopen("/dev/null", "w", stdout) || !std::freopen("/dev/null", "w", stderr)) {
                ::_exit(1);
            }
            ::_exit(entry ? entry() : 1);
        }

    } // namespace

    std::optional<int> read_pid_file(const std::filesystem::path& path) {
        std::ifstream input(path);
        if (!input.good()) {
            return std::nullopt;
        }
        std::string text;
        std::getline(input, text);
        const auto trimmed = trim_copy(text);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        try {
            std::size_t index = 0;
            const int   pid   = std::stoi(trimmed, &index, 10);
            if (index != trimmed.size() || pid <= 0) {
                return std::nullopt;
            }
            return pid;
        } catch (const std::exception&) { return std::nullopt; }
    }

    bool write_pid_file(const std::filesystem::path& path, int pid, std::string* error) {
        return write_file_atomic(path, std::to_string(pid) + "\n", error);
    }

    void remove_pid_file(const std::filesystem::path& path, int pid) {
        if (read_pid_file(path) != pid) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::optional<int> running_daemon_pid(const std::filesystem::path& path) {
        const auto pid = read_pid_file(path);
        if (!pid) {
            return std::nullopt;
        }
        if (!is_process_alive(*pid)) {
            remove_pid_file(path, *pid);
            return std::nullopt;
        }
        return pid;
    }

    DaemonStatus collect_daemon_status(const Paths& paths, const Config& config) {
        DaemonStatus status{
            .running               = false,
            .pid                   = running_daemon_pid(paths.pid_path),
            .watches               = load_watch_registry(paths.watch_registry_path),
            .baseline_established  = false,
            .environment_count     = 0,
            .config_path           = paths.config_path,
            .config_present        = false,
            .auto_save_enabled     = config.auto_save_enabled,
            .notifications_enabled = config.notifications_enabled,
            .impact_threshold      = config.impact_threshold,
            .scan_interval         = config.scan_interval,
        };
        status.running = status.pid.has_value();

        std::error_code ec;
        status.config_present = std::filesystem::exists(paths.config_path, ec);

        std::string error;
        if (const auto baseline = load_baseline(paths.baseline_path, &error)) {
            status.baseline_established = true;
            status.environment_count    = static_cast<int>(baseline->environments.size());
        }
        return status;
    }

    std::expected<std::string, std::string> start_daemon(const Paths& paths, bool force, const DaemonEntry& entry) {
        if (const auto pid = running_daemon_pid(paths.pid_path)) {
            if (!force) {
                return std::unexpected("daemon already running (pid " + std::to_string(*pid) + "), use --force to restart");
            }
            if (const auto stopped = stop_daemon(paths); !stopped) {
                return std::unexpected(stopped.error());
            }
        }

        std::error_code ec;
        if (!std::filesystem::exists(paths.config_path, ec)) {
            if (const auto error = write_default_config(paths.config_path)) {
                warn_log("daemon", "unable to write default config: " + *error);
            } else {
                info_log("daemon", "wrote default config to " + paths.config_path.string());
            }
        }
        std::filesystem::create_directories(paths.state_dir, ec);

        std::fflush(nullptr);
        const pid_t child = ::fork();
        if (child < 0) {
            return std::unexpected(std::string("fork failed: ") + std::strerror(errno));
        }
        if (child == 0) {
            become_daemon(entry);
        }
        int status = 0;
        while (::waitpid(child, &status, 0) < 0) {
            if (errno != EINTR) {
                return std::unexpected(std::string("waitpid failed: ") + std::strerror(errno));
            }
        }
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            return std::unexpected("daemon failed to detach");
        }

        const auto deadline = std::chrono::steady_clock::now() + kStartTimeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (const auto pid = running_daemon_pid(paths.pid_path)) {
                return "daemon started (pid " + std::to_string(*pid) + ")";
            }
            std::this_thread::sleep_for(kPollInterval);
        }
        return std::unexpected("daemon did not start, see " + paths.daemon_log_path.string());
    }

    std::expected<std::string, std::string> stop_daemon(const Paths& paths, std::chrono::milliseconds timeout) {
        const auto pid = running_daemon_pid(paths.pid_path);
        if (!pid) {
            return std::string("daemon not running");
        }
        if (::kill(*pid, SIGTERM) != 0 && errno != ESRCH) {
            return std::unexpected("unable to signal pid " + std::to_string(*pid) + ": " + std::strerror(errno));
        }
        if (!wait_for_exit(*pid, timeout)) {
            return std::unexpected("daemon (pid " + std::to_string(*pid) + ") did not exit within " +
                                   std::to_string(std::chrono::duration_cast<std::chrono::seconds>(timeout).count()) + "s");
        }
        remove_pid_file(paths.pid_path, *pid);
        return "daemon stopped (pid " + std::to_string(*pid) + ")";
    }

    SignalStopper::SignalStopper(std::stop_source source) : source_(std::move(source)) {
        const sigset_t set = stop_signals();
        ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
        thread_ = std::jthread([this] {
            const sigset_t waited = stop_signals();
            int            signal = 0;
            while (::sigwait(&waited, &signal) != 0) {}
            if (!finished_.load()) {
                info_log("daemon", std::string("received ") + (signal == SIGINT ? "SIGINT" : "SIGTERM"));
            }
            source_.request_stop();
        });
    }

    SignalStopper::~SignalStopper() {
        finished_ = true;
        if (thread_.joinable() && !source_.stop_requested()) {
            ::pthread_kill(thread_.native_handle(), SIGTERM);
        }
    }

    bool install_daemon_log_sink(const std::filesystem::path& path) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        std::FILE* file = std::fopen(path.c_str(), "a");
        if (!file) {
            return false;
        }
        {
            std::lock_guard lock(daemon_log_mutex);
            if (daemon_log) {
                std::fclose(daemon_log);
            }
            daemon_log = file;
        }
        set_log_sink(daemon_log_sink);
        return true;
    }

    void close_daemon_log_sink() {
        clear_log_sink();
        std::lock_guard lock(daemon_log_mutex);
        if (daemon_log) {
            std::fclose(daemon_log);
            daemon_log = nullptr;
        }
    }

} // namespace hyprsession
