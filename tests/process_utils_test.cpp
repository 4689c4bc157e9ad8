#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>

#include <unistd.h>

#include <gtest/gtest.h>

#include "hyprsession/process_utils.hpp"

namespace {

    std::filesystem::path make_proc_root() {
        const auto         now = std::chrono::steady_clock::now().time_since_epoch().count();
        std::random_device rd;
        return std::filesystem::temp_directory_path() / (std::string("hyprsession-proc-") + std::to_string(now) + "-" + std::to_string(rd()));
    }

    void write_cmdline(const std::filesystem::path& proc_root, int pid, const std::string& contents) {
        const auto dir = proc_root / std::to_string(pid);
        std::filesystem::create_directories(dir);
        std::ofstream output(dir / "cmdline", std::ios::binary);
        output << contents;
    }

} // namespace

TEST(ProcessUtils, ReadsNullSeparatedCmdline) {
    const auto proc_root = make_proc_root();
    write_cmdline(proc_root, 4242, std::string("alacritty\0-e\0nvim\0.\0", 20));

    const auto cmdline = hyprsession::read_process_cmdline(4242, proc_root);

    ASSERT_TRUE(cmdline.has_value());
    EXPECT_EQ(*cmdline, "alacritty -e nvim .");
    std::filesystem::remove_all(proc_root);
}

TEST(ProcessUtils, MissingOrEmptyCmdlineIsNullopt) {
    const auto proc_root = make_proc_root();
    write_cmdline(proc_root, 7, "");

    EXPECT_FALSE(hyprsession::read_process_cmdline(7, proc_root).has_value());
    EXPECT_FALSE(hyprsession::read_process_cmdline(8, proc_root).has_value());
    EXPECT_FALSE(hyprsession::read_process_cmdline(0, proc_root).has_value());
    std::filesystem::remove_all(proc_root);
}

TEST(ProcessUtils, CurrentProcessIsAlive) {
    EXPECT_TRUE(hyprsession::is_process_alive(static_cast<int>(::getpid())));
    EXPECT_FALSE(hyprsession::is_process_alive(0));
    EXPECT_FALSE(hyprsession::is_process_alive(-5));
}
