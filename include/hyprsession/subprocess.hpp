#ifndef HYPRSESSION_SUBPROCESS_HPP
#define HYPRSESSION_SUBPROCESS_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hyprsession {

    enum class ProcessOutcome {
        kExited,
        kSignaled,
        kTimedOut,
        kCancelled,
        kSpawnFailed,
    };

    struct ProcessOptions {
        std::vector<std::string>                         argv;
        std::vector<std::pair<std::string, std::string>> env            = {};
        std::chrono::milliseconds                        timeout        = std::chrono::milliseconds(0);
        std::stop_token                                  stop           = {};
        bool                                             discard_output = true;
    };

    struct ProcessResult {
        ProcessOutcome outcome;
        int            exit_code = -1;
        std::string    error     = {};
    };

    ProcessResult                        run_process(const ProcessOptions& options);
    std::optional<std::string>           spawn_detached(const std::vector<std::string>& argv);
    std::optional<std::filesystem::path> find_in_path(std::string_view name);
    std::string                          describe_process_result(const ProcessResult& result);

} // namespace hyprsession

#endif // HYPRSESSION_SUBPROCESS_HPP
