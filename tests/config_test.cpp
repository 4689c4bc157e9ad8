#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "hyprsession/config.hpp"
#include "hyprsession/logging.hpp"

namespace {

    std::filesystem::path make_temp_dir() {
        const auto base   = std::filesystem::temp_directory_path();
        const auto unique = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" + std::to_string(std::random_device{}());
        auto       dir    = base / ("hyprsession_config_" + unique);
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::vector<std::string> g_warnings;

    void                     capture_warning(std::string_view message) {
        g_warnings.emplace_back(message);
    }

}

TEST(ConfigDefaults, MatchDocumentedValues) {
    const hyprsession::Config config;

    EXPECT_EQ(config.scan_interval, std::chrono::seconds(60));
    EXPECT_EQ(config.impact_threshold, 2);
    EXPECT_TRUE(config.auto_save_enabled);
    EXPECT_TRUE(config.notifications_enabled);
    EXPECT_EQ(config.max_watches, 10);
    EXPECT_EQ(config.watch_depth, 3);
    EXPECT_EQ(config.hook_timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.launch_delay, std::chrono::seconds(2));
    EXPECT_EQ(config.window_wait_attempts, 30);
    EXPECT_EQ(config.readiness_attempts, 10);
    EXPECT_EQ(config.keep_snapshots, 3);
    EXPECT_FALSE(config.debug_logging);
}

TEST(ConfigParse, ParsesShellStyleAssignments) {
    std::vector<hyprsession::ConfigIssue> issues;
    const auto                            overrides = hyprsession::parse_config_text(R"(# monitor settings
MONITOR_INTERVAL=30
export CHANGE_THRESHOLD=3
AUTO_SAVE_ENABLED="false"
NOTIFICATION_ENABLED='no'
CUSTOM_PATHS="~/projects /opt/envs"
MAX_MONITORS=4 # keep it small
MONITOR_PYENV=off
READINESS_BACKOFF=250
)",
                                                                                     &issues);

    EXPECT_TRUE(issues.empty());
    EXPECT_EQ(overrides.scan_interval, std::chrono::seconds(30));
    EXPECT_EQ(overrides.impact_threshold, 3);
    EXPECT_EQ(overrides.auto_save_enabled, false);
    EXPECT_EQ(overrides.notifications_enabled, false);
    ASSERT_TRUE(overrides.extra_watch_dirs.has_value());
    EXPECT_EQ(*overrides.extra_watch_dirs, (std::vector<std::string>{"~/projects", "/opt/envs"}));
    EXPECT_EQ(overrides.max_watches, 4);
    EXPECT_EQ(overrides.monitor_pyenv, false);
    EXPECT_EQ(overrides.readiness_backoff, std::chrono::milliseconds(250));
    EXPECT_FALSE(overrides.monitor_conda.has_value());
}

TEST(ConfigParse, ReportsInvalidAndUnknownKeys) {
    std::vector<hyprsession::ConfigIssue> issues;
    const auto                            overrides = hyprsession::parse_config_text("MONITOR_INTERVAL=soon\nBOGUS=1\nnot an assignment\nMAX_MONITORS=0\n", &issues);

    ASSERT_EQ(issues.size(), 4u);
    EXPECT_EQ(issues[0].line, 1);
    EXPECT_EQ(issues[0].key, "MONITOR_INTERVAL");
    EXPECT_EQ(issues[0].message, "invalid value 'soon'");
    EXPECT_EQ(issues[1].message, "unknown key");
    EXPECT_EQ(issues[2].message, "expected KEY=value");
    EXPECT_EQ(issues[3].key, "MAX_MONITORS");
    EXPECT_FALSE(overrides.scan_interval.has_value());
    EXPECT_FALSE(overrides.max_watches.has_value());
}

TEST(ConfigOverrides, AppliesOnlySetFields) {
    hyprsession::ConfigOverrides overrides;
    overrides.impact_threshold = 5;
    overrides.debug_logging    = true;

    const auto config = hyprsession::apply_overrides(hyprsession::Config{}, overrides);

    EXPECT_EQ(config.impact_threshold, 5);
    EXPECT_TRUE(config.debug_logging);
    EXPECT_EQ(config.scan_interval, std::chrono::seconds(60));
    EXPECT_EQ(config.max_watches, 10);
}

TEST(ConfigLoad, MissingFileYieldsDefaults) {
    const auto dir    = make_temp_dir();

    const auto config = hyprsession::load_config(dir / "absent.conf");

    EXPECT_EQ(config.impact_threshold, 2);
    EXPECT_TRUE(config.auto_save_enabled);
    std::filesystem::remove_all(dir);
}

TEST(ConfigLoad, InvalidValueKeepsDefaultAndWarns) {
    const auto dir  = make_temp_dir();
    const auto path = dir / "hyprsession.conf";
    {
        std::ofstream output(path);
        output << "CHANGE_THRESHOLD=high\nMONITOR_INTERVAL=15\n";
    }
    g_warnings.clear();
    hyprsession::set_log_sink(capture_warning);

    const auto config = hyprsession::load_config(path);

    hyprsession::clear_log_sink();
    EXPECT_EQ(config.impact_threshold, 2);
    EXPECT_EQ(config.scan_interval, std::chrono::seconds(15));
    ASSERT_EQ(g_warnings.size(), 1u);
    EXPECT_NE(g_warnings[0].find("ConfigurationError line 1 CHANGE_THRESHOLD"), std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST(ConfigLoad, DefaultConfigRoundTripsWithoutIssues) {
    std::vector<hyprsession::ConfigIssue> issues;
    const auto                            overrides = hyprsession::parse_config_text(hyprsession::default_config_text(), &issues);
    const auto                            config    = hyprsession::apply_overrides(hyprsession::Config{}, overrides);

    EXPECT_TRUE(issues.empty());
    EXPECT_EQ(config.scan_interval, std::chrono::seconds(60));
    EXPECT_TRUE(config.extra_watch_dirs.empty());
}

TEST(ConfigLoad, WriteDefaultConfigDoesNotOverwrite) {
    const auto dir  = make_temp_dir();
    const auto path = dir / "nested" / "hyprsession.conf";

    EXPECT_EQ(hyprsession::write_default_config(path), std::nullopt);
    ASSERT_TRUE(std::filesystem::exists(path));
    {
        std::ofstream output(path);
        output << "CHANGE_THRESHOLD=4\n";
    }
    EXPECT_EQ(hyprsession::write_default_config(path), std::nullopt);

    EXPECT_EQ(hyprsession::load_config(path).impact_threshold, 4);
    std::filesystem::remove_all(dir);
}
