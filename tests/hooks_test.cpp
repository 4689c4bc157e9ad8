#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "hyprsession/hooks.hpp"
#include "hyprsession/logging.hpp"

namespace {

    std::filesystem::path make_temp_dir() {
        const auto base   = std::filesystem::temp_directory_path();
        const auto unique = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" + std::to_string(std::random_device{}());
        auto       dir    = base / ("hyprsession_hooks_" + unique);
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::filesystem::path write_script(const std::filesystem::path& path, const std::string& body, bool executable = true) {
        std::filesystem::create_directories(path.parent_path());
        {
            std::ofstream output(path);
            output << "#!/bin/sh\n" << body << "\n";
        }
        if (executable) {
            std::filesystem::permissions(path, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
        }
        return path;
    }

    std::vector<std::string> g_messages;

    void                     capture(std::string_view message) {
        g_messages.emplace_back(message);
    }

    class RecordingRunner : public hyprsession::HookRunner {
      public:
        hyprsession::HookOutcome run(const hyprsession::HookDescriptor& hook, const hyprsession::HookContext&) override {
            names.push_back(hook.name);
            if (hook.name == "throws") {
                throw std::runtime_error("boom");
            }
            return hyprsession::HookOutcome{.success = true, .detail = "exit code 0"};
        }

        std::vector<std::string> names;
    };

}

TEST(HookPhase, NamesRoundTrip) {
    EXPECT_EQ(hyprsession::hook_phase_name(hyprsession::HookPhase::kPreSave), "pre-save");
    EXPECT_EQ(hyprsession::parse_hook_phase("post-restore"), hyprsession::HookPhase::kPostRestore);
    EXPECT_FALSE(hyprsession::parse_hook_phase("during-save").has_value());
}

TEST(HookRegistry, DiscoversPrimaryHookFirst) {
    const auto dir = make_temp_dir();
    write_script(dir / "pre-save" / "a-editor", "exit 0");
    write_script(dir / "pre-save" / "comprehensive-session-capture", "exit 0");
    write_script(dir / "pre-save" / ".hidden", "exit 0");
    write_script(dir / "post-restore" / "terminal", "exit 0", false);

    hyprsession::HookRegistry registry;
    registry.discover(dir);

    const auto pre_save = registry.hooks_for(hyprsession::HookPhase::kPreSave);
    ASSERT_EQ(pre_save.size(), 2u);
    EXPECT_EQ(pre_save[0].name, "comprehensive-session-capture");
    EXPECT_EQ(pre_save[1].name, "a-editor");
    EXPECT_EQ(registry.hooks_for(hyprsession::HookPhase::kPostRestore).size(), 1u);
    EXPECT_EQ(registry.executable_count(hyprsession::HookPhase::kPostRestore), 0);
    std::filesystem::remove_all(dir);
}

TEST(HookPipeline, FailingHookDoesNotStopTheRest) {
    const auto dir = make_temp_dir();
    hyprsession::HookRegistry registry;
    registry.register_hook("one", write_script(dir / "one", "exit 0"), hyprsession::HookPhase::kPreSave);
    registry.register_hook("two", write_script(dir / "two", "exit 1"), hyprsession::HookPhase::kPreSave);
    registry.register_hook("three", write_script(dir / "three", "touch \"$HYPRSESSION_STATE_DIR/three-ran\""), hyprsession::HookPhase::kPreSave);
    registry.register_hook("four", write_script(dir / "four", "test \"$1\" = pre-save"), hyprsession::HookPhase::kPreSave);

    g_messages.clear();
    hyprsession::set_log_sink(capture);
    hyprsession::ProcessHookRunner runner;
    hyprsession::HookPipeline      pipeline(registry, runner);
    const auto                     summary = pipeline.run(hyprsession::HookPhase::kPreSave, hyprsession::HookContext{.state_dir = dir});
    hyprsession::clear_log_sink();

    EXPECT_EQ(summary.total, 4);
    EXPECT_EQ(summary.succeeded, 3);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_TRUE(std::filesystem::exists(dir / "three-ran"));
    bool reported = false;
    for (const auto& message : g_messages) {
        if (message.find("HookFailure pre-save/two: exit code 1") != std::string::npos) {
            reported = true;
        }
    }
    EXPECT_TRUE(reported);
    std::filesystem::remove_all(dir);
}

TEST(HookPipeline, MissingAndNonExecutableHooksFail) {
    const auto dir = make_temp_dir();
    hyprsession::HookRegistry registry;
    registry.register_hook("gone", dir / "gone", hyprsession::HookPhase::kPostRestore);
    registry.register_hook("plain", write_script(dir / "plain", "exit 0", false), hyprsession::HookPhase::kPostRestore);

    hyprsession::set_log_sink(capture);
    RecordingRunner           runner;
    hyprsession::HookPipeline pipeline(registry, runner);
    const auto                summary = pipeline.run(hyprsession::HookPhase::kPostRestore, hyprsession::HookContext{.state_dir = dir});
    hyprsession::clear_log_sink();

    EXPECT_EQ(summary.total, 2);
    EXPECT_EQ(summary.failed, 2);
    EXPECT_TRUE(runner.names.empty());
    std::filesystem::remove_all(dir);
}

TEST(HookPipeline, ThrowingRunnerCountsAsFailure) {
    const auto dir = make_temp_dir();
    hyprsession::HookRegistry registry;
    registry.register_hook("throws", write_script(dir / "throws", "exit 0"), hyprsession::HookPhase::kPreSave);
    registry.register_hook("after", write_script(dir / "after", "exit 0"), hyprsession::HookPhase::kPreSave);

    hyprsession::set_log_sink(capture);
    RecordingRunner           runner;
    hyprsession::HookPipeline pipeline(registry, runner);
    const auto                summary = pipeline.run(hyprsession::HookPhase::kPreSave, hyprsession::HookContext{.state_dir = dir});
    hyprsession::clear_log_sink();

    EXPECT_EQ(summary.succeeded, 1);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(runner.names, (std::vector<std::string>{"throws", "after"}));
    std::filesystem::remove_all(dir);
}

TEST(HookPipeline, TimedOutHookFails) {
    const auto dir = make_temp_dir();
    hyprsession::HookRegistry registry;
    registry.register_hook("slow", write_script(dir / "slow", "exec sleep 5"), hyprsession::HookPhase::kPreSave);

    hyprsession::set_log_sink(capture);
    hyprsession::ProcessHookRunner runner;
    hyprsession::HookPipeline      pipeline(registry, runner);
    const auto summary = pipeline.run(hyprsession::HookPhase::kPreSave, hyprsession::HookContext{.state_dir = dir, .timeout = std::chrono::seconds(1)});
    hyprsession::clear_log_sink();

    EXPECT_EQ(summary.failed, 1);
    std::filesystem::remove_all(dir);
}
