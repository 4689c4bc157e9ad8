#include <stdexcept>

#include <gtest/gtest.h>

#include "hyprsession/paths.hpp"

TEST(PathsResolve, PrefersXdgDirectories) {
    const hyprsession::EnvConfig env{.home = "/home/tester", .xdg_config_home = "/tmp/xdg", .xdg_state_home = "/tmp/state"};
    const auto                   paths = hyprsession::resolve_paths(env);

    EXPECT_EQ(paths.config_dir, std::filesystem::path("/tmp/xdg/hyprsession"));
    EXPECT_EQ(paths.config_path, std::filesystem::path("/tmp/xdg/hyprsession/hyprsession.conf"));
    EXPECT_EQ(paths.hooks_dir, std::filesystem::path("/tmp/xdg/hyprsession/hooks"));
    EXPECT_EQ(paths.state_dir, std::filesystem::path("/tmp/state/hyprsession"));
    EXPECT_EQ(paths.session_dir, std::filesystem::path("/tmp/state/hyprsession/session"));
    EXPECT_EQ(paths.proc_root, std::filesystem::path("/proc"));
}

TEST(PathsResolve, FallsBackToHome) {
    const hyprsession::EnvConfig env{.home = "/home/tester", .xdg_config_home = std::nullopt, .xdg_state_home = std::nullopt};
    const auto                   paths = hyprsession::resolve_paths(env);

    EXPECT_EQ(paths.home_dir, std::filesystem::path("/home/tester"));
    EXPECT_EQ(paths.config_path, std::filesystem::path("/home/tester/.config/hyprsession/hyprsession.conf"));
    EXPECT_EQ(paths.baseline_path, std::filesystem::path("/home/tester/.local/state/hyprsession/environment_baseline.json"));
    EXPECT_EQ(paths.current_path, std::filesystem::path("/home/tester/.local/state/hyprsession/environment_current.json"));
    EXPECT_EQ(paths.change_log_path, std::filesystem::path("/home/tester/.local/state/hyprsession/changes.log"));
    EXPECT_EQ(paths.pid_path, std::filesystem::path("/home/tester/.local/state/hyprsession/daemon.pid"));
    EXPECT_EQ(paths.watch_registry_path, std::filesystem::path("/home/tester/.local/state/hyprsession/watches.json"));
    EXPECT_EQ(paths.save_lock_path, std::filesystem::path("/home/tester/.local/state/hyprsession/save.lock"));
}

TEST(PathsResolve, ReturnsNulloptWithoutHome) {
    const hyprsession::EnvConfig env{.home = std::nullopt, .xdg_config_home = std::nullopt, .xdg_state_home = std::nullopt};

    const auto                   paths = hyprsession::try_resolve_paths(env);

    EXPECT_FALSE(paths.has_value());
}

TEST(PathsResolve, ThrowsWithoutHome) {
    const hyprsession::EnvConfig env{.home = std::nullopt, .xdg_config_home = "/tmp/xdg", .xdg_state_home = std::nullopt};

    EXPECT_THROW(hyprsession::resolve_paths(env), std::runtime_error);
}
