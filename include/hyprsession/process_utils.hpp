#ifndef HYPRSESSION_PROCESS_UTILS_HPP
#define HYPRSESSION_PROCESS_UTILS_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace hyprsession {

    std::optional<std::string> read_process_cmdline(int pid, const std::filesystem::path& proc_root);
    bool                       is_process_alive(int pid);

} // namespace hyprsession

#endif // HYPRSESSION_PROCESS_UTILS_HPP
