#include "hyprsession/process_utils.hpp"

#include <cerrno>
#include <fstream>

#include <signal.h>

namespace hyprsession {

    std::optional<std::string> read_process_cmdline(int pid, const std::filesystem::path& proc_root) {
        if (pid <= 0) {
            return std::nullopt;
        }
        const auto    path = proc_root / std::to_string(pid) / "cmdline";
        std::ifstream input(path, std::ios::binary);
        if (!input.good()) {
            return std::nullopt;
        }
        std::string raw((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        if (raw.empty()) {
            return std::nullopt;
        }
        std::string output;
        output.reserve(raw.size());
        bool pending_space = false;
        for (const char ch : raw) {
            if (ch == '\0') {
                pending_space = true;
                continue;
            }
            if (pending_space && !output.empty()) {
                output.push_back(' ');
            }
            pending_space = false;
            output.push_back(ch);
        }
        while (!output.empty() && output.back() == ' ') {
            output.pop_back();
        }
        if (output.empty()) {
            return std::nullopt;
        }
        return output;
    }

    bool is_process_alive(int pid) {
        if (pid <= 0) {
            return false;
        }
        if (::kill(pid, 0) == 0) {
            return true;
        }
        return errno == EPERM;
    }

} // namespace hyprsession
