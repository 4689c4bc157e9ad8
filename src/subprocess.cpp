#include "hyprsession/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "hyprsession/file_descriptor.hpp"

extern char** environ;

namespace hyprsession {

    namespace {

        constexpr auto kPollInterval = std::chrono::milliseconds(10);
        constexpr auto kKillGrace    = std::chrono::milliseconds(1000);

        struct ExecImage {
            std::vector<std::string> argv_storage;
            std::vector<std::string> env_storage;
            std::vector<char*>       argv;
            std::vector<char*>       envp;
        };

        ExecImage build_exec_image(const ProcessOptions& options) {
            ExecImage image;
            image.argv_storage = options.argv;
            for (char** entry = environ; entry && *entry; ++entry) {
                const std::string_view text(*entry);
                const auto             equals   = text.find('=');
                const auto             name     = text.substr(0, equals);
                const bool             replaced = std::ranges::any_of(options.env, [&](const auto& pair) { return pair.first == name; });
                if (!replaced) {
                    image.env_storage.emplace_back(text);
                }
            }
            for (const auto& [name, value] : options.env) {
                image.env_storage.push_back(name + "=" + value);
            }
            for (auto& arg : image.argv_storage) {
                image.argv.push_back(arg.data());
            }
            image.argv.push_back(nullptr);
            for (auto& entry : image.env_storage) {
                image.envp.push_back(entry.data());
            }
            image.envp.push_back(nullptr);
            return image;
        }

        [[noreturn]] void exec_child(const ExecImage& image, int error_pipe, bool discard_output) {
            sigset_t empty;
            sigemptyset(&empty);
            ::sigprocmask(SIG_SETMASK, &empty, nullptr);
            ::setpgid(0, 0);

            const int null_fd = ::open("/dev/null", O_RDWR);
            if (null_fd >= 0) {
                ::dup2(null_fd, STDIN_FILENO);
                if (discard_output) {
                    ::dup2(null_fd, STDOUT_FILENO);
                    ::dup2(null_fd, STDERR_FILENO);
                }
                if (null_fd > STDERR_FILENO) {
                    ::close(null_fd);
                }
            }

            ::execvpe(image.argv[0], image.argv.data(), image.envp.data());
            const int error = errno;
            (void)::write(error_pipe, &error, sizeof(error));
            ::_exit(127);
        }

        int read_exec_error(int fd) {
            int error = 0;
            while (true) {
                const auto received = ::read(fd, &error, sizeof(error));
                if (received < 0 && errno == EINTR) {
                    continue;
                }
                if (received == static_cast<ssize_t>(sizeof(error))) {
                    return error;
                }
                return 0;
            }
        }

        int wait_blocking(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    return -1;
                }
            }
            return status;
        }

        void terminate_group(pid_t pid) {
            ::kill(-pid, SIGTERM);
            const auto deadline = std::chrono::steady_clock::now() + kKillGrace;
            while (std::chrono::steady_clock::now() < deadline) {
                int status = 0;
                if (::waitpid(pid, &status, WNOHANG) == pid) {
                    return;
                }
                std::this_thread::sleep_for(kPollInterval);
            }
            ::kill(-pid, SIGKILL);
            wait_blocking(pid);
        }

        ProcessResult result_from_status(int status) {
            if (WIFEXITED(status)) {
                return ProcessResult{.outcome = ProcessOutcome::kExited, .exit_code = WEXITSTATUS(status)};
            }
            if (WIFSIGNALED(status)) {
                return ProcessResult{.outcome = ProcessOutcome::kSignaled, .exit_code = 128 + WTERMSIG(status)};
            }
            return ProcessResult{.outcome = ProcessOutcome::kSignaled, .exit_code = -1};
        }

    } // namespace

    ProcessResult run_process(const ProcessOptions& options) {
        if (options.argv.empty()) {
            return ProcessResult{.outcome = ProcessOutcome::kSpawnFailed, .error = "empty command"};
        }
        const auto image = build_exec_image(options);

        int        pipe_fds[2];
        if (::pipe2(pipe_fds, O_CLOEXEC) < 0) {
            return ProcessResult{.outcome = ProcessOutcome::kSpawnFailed, .error = std::string("pipe failed: ") + std::strerror(errno)};
        }
        FileDescriptor read_end(pipe_fds[0]);
        FileDescriptor write_end(pipe_fds[1]);

        const pid_t    pid = ::fork();
        if (pid < 0) {
            return ProcessResult{.outcome = ProcessOutcome::kSpawnFailed, .error = std::string("fork failed: ") + std::strerror(errno)};
        }
        if (pid == 0) {
            exec_child(image, write_end.get(), options.discard_output);
        }
        write_end.reset();

        if (const int exec_error = read_exec_error(read_end.get()); exec_error != 0) {
            wait_blocking(pid);
            return ProcessResult{.outcome = ProcessOutcome::kSpawnFailed, .error = std::strerror(exec_error)};
        }

        const bool has_timeout = options.timeout.count() > 0;
        const auto deadline    = std::chrono::steady_clock::now() + options.timeout;
        while (true) {
            int         status = 0;
            const pid_t done   = ::waitpid(pid, &status, WNOHANG);
            if (done == pid) {
                return result_from_status(status);
            }
            if (done < 0 && errno != EINTR) {
                return ProcessResult{.outcome = ProcessOutcome::kSpawnFailed, .error = std::string("waitpid failed: ") + std::strerror(errno)};
            }
            if (options.stop.stop_requested()) {
                terminate_group(pid);
                return ProcessResult{.outcome = ProcessOutcome::kCancelled, .error = "cancelled"};
            }
            if (has_timeout && std::chrono::steady_clock::now() >= deadline) {
                terminate_group(pid);
                return ProcessResult{.outcome = ProcessOutcome::kTimedOut, .error = "timed out after " + std::to_string(options.timeout.count()) + "ms"};
            }
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    std::optional<std::string> spawn_detached(const std::vector<std::string>& argv) {
        if (argv.empty()) {
            return "empty command";
        }
        const auto  image = build_exec_image(ProcessOptions{.argv = argv});

        const pid_t pid   = ::fork();
        if (pid < 0) {
            return std::string("fork failed: ") + std::strerror(errno);
        }
        if (pid == 0) {
            const pid_t grandchild = ::fork();
            if (grandchild == 0) {
                ::setsid();
                exec_child(image, -1, true);
            }
            ::_exit(grandchild < 0 ? 1 : 0);
        }
        const int status = wait_blocking(pid);
        if (status < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            return "unable to spawn " + argv.front();
        }
        return std::nullopt;
    }

    std::optional<std::filesystem::path> find_in_path(std::string_view name) {
        const char* path = std::getenv("PATH");
        if (!path || *path == '\0') {
            return std::nullopt;
        }
        std::string_view remaining(path);
        while (!remaining.empty()) {
            const auto colon = remaining.find(':');
            const auto entry = remaining.substr(0, colon);
            if (!entry.empty()) {
                const auto candidate = std::filesystem::path(entry) / name;
                if (::access(candidate.c_str(), X_OK) == 0) {
                    return candidate;
                }
            }
            if (colon == std::string_view::npos) {
                break;
            }
            remaining.remove_prefix(colon + 1);
        }
        return std::nullopt;
    }

    std::string describe_process_result(const ProcessResult& result) {
        switch (result.outcome) {
            case ProcessOutcome::kExited: return "exit code " + std::to_string(result.exit_code);
            case ProcessOutcome::kSignaled: return "terminated by signal " + std::to_string(result.exit_code - 128);
            case ProcessOutcome::kTimedOut: return result.error;
            case ProcessOutcome::kCancelled: return "cancelled";
            case ProcessOutcome::kSpawnFailed: return "spawn failed: " + result.error;
        }
        return "unknown";
    }

} // namespace hyprsession
