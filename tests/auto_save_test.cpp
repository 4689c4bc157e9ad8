#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "hyprsession/auto_save.hpp"
#include "hyprsession/logging.hpp"
#include "support/recording_notifier.hpp"

using Clock = std::chrono::steady_clock;
using hyprsession::ChangeType;
using hyprsession::TriggerDecision;

namespace {

    std::filesystem::path make_temp_dir() {
        const auto base   = std::filesystem::temp_directory_path();
        const auto unique = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" + std::to_string(std::random_device{}());
        auto       dir    = base / ("hyprsession_autosave_" + unique);
        std::filesystem::create_directories(dir);
        return dir;
    }

    void discard(std::string_view) {}

    class AutoSaveTriggerTest : public ::testing::Test {
      protected:
        void SetUp() override {
            hyprsession::set_log_sink(discard);
        }

        void TearDown() override {
            hyprsession::clear_log_sink();
        }

        hyprsession::SaveAction counting_save() {
            return [this]() -> std::optional<std::string> {
                ++saves;
                return save_error;
            };
        }

        int                                    saves = 0;
        std::optional<std::string>             save_error;
        hyprsession::testing::RecordingNotifier notifier;
    };

}

TEST(ShouldAutoSave, ThresholdIsInclusive) {
    EXPECT_TRUE(hyprsession::should_auto_save(2, 2, true));
    EXPECT_FALSE(hyprsession::should_auto_save(1, 2, true));
    EXPECT_FALSE(hyprsession::should_auto_save(5, 2, false));
}

TEST_F(AutoSaveTriggerTest, QualifyingChangeSavesAndNotifies) {
    hyprsession::AutoSaveTrigger trigger({.enabled = true, .threshold = 2}, counting_save(), notifier);

    const auto                   decision = trigger.on_change(ChangeType::kEnvironmentCreated, "conda:ml", 4, Clock::time_point{});

    EXPECT_EQ(decision, TriggerDecision::kSaved);
    EXPECT_EQ(saves, 1);
    ASSERT_EQ(notifier.sent.size(), 2u);
    EXPECT_EQ(notifier.sent[0].title, "Environment Change Detected");
    EXPECT_EQ(notifier.sent[0].message, "environment_created: conda:ml (impact 4)");
    EXPECT_EQ(notifier.sent[1].title, "Session Saved");
}

TEST_F(AutoSaveTriggerTest, BelowThresholdDoesNothing) {
    hyprsession::AutoSaveTrigger trigger({.enabled = true, .threshold = 2}, counting_save(), notifier);

    EXPECT_EQ(trigger.on_change(ChangeType::kEnvironmentBinaryModified, "/envs/x/bin/python", 1, Clock::time_point{}), TriggerDecision::kBelowThreshold);
    EXPECT_EQ(saves, 0);
    EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(AutoSaveTriggerTest, DisabledIgnoresEverything) {
    hyprsession::AutoSaveTrigger trigger({.enabled = false, .threshold = 2}, counting_save(), notifier);

    EXPECT_EQ(trigger.on_change(ChangeType::kEnvironmentCreated, "conda:ml", 4, Clock::time_point{}), TriggerDecision::kDisabled);
    EXPECT_FALSE(trigger.flush_pending(Clock::time_point{} + std::chrono::hours(1)).has_value());
    EXPECT_EQ(saves, 0);
}

TEST_F(AutoSaveTriggerTest, BurstIsCoalescedIntoOneDeferredSave) {
    hyprsession::AutoSaveTrigger trigger({.enabled = true, .threshold = 2, .min_interval = std::chrono::seconds(30)}, counting_save(), notifier);
    const auto                   t0 = Clock::time_point{};

    EXPECT_EQ(trigger.on_change(ChangeType::kEnvironmentCreated, "conda:a", 4, t0), TriggerDecision::kSaved);
    EXPECT_EQ(trigger.on_change(ChangeType::kEnvironmentCreated, "conda:b", 4, t0 + std::chrono::seconds(1)), TriggerDecision::kDeferred);
    EXPECT_EQ(trigger.on_change(ChangeType::kDependencyFileModified, "/w/requirements.txt", 2, t0 + std::chrono::seconds(2)), TriggerDecision::kDeferred);
    EXPECT_FALSE(trigger.flush_pending(t0 + std::chrono::seconds(10)).has_value());
    EXPECT_EQ(trigger.flush_pending(t0 + std::chrono::seconds(31)), TriggerDecision::kSaved);
    EXPECT_FALSE(trigger.flush_pending(t0 + std::chrono::seconds(90)).has_value());
    EXPECT_EQ(saves, 2);
}

TEST_F(AutoSaveTriggerTest, FailedSaveSendsCriticalNotification) {
    save_error = "CaptureFailure: hyprctl: connection refused";
    hyprsession::AutoSaveTrigger trigger({.enabled = true, .threshold = 2}, counting_save(), notifier);

    EXPECT_EQ(trigger.on_change(ChangeType::kEnvironmentDeleted, "venv:api", 3, Clock::time_point{}), TriggerDecision::kSaveFailed);
    ASSERT_FALSE(notifier.sent.empty());
    EXPECT_EQ(notifier.sent.back().title, "Session Save Failed");
    EXPECT_EQ(notifier.sent.back().urgency, hyprsession::Urgency::kCritical);
}

TEST_F(AutoSaveTriggerTest, ChangeLogRecordsEveryDecision) {
    const auto                   dir = make_temp_dir();
    hyprsession::AutoSaveTrigger trigger({.enabled = true, .threshold = 2, .change_log = dir / "changes.jsonl"}, counting_save(), notifier);

    trigger.on_change(ChangeType::kFileModified, "/w/notes.md", 0, Clock::time_point{});
    trigger.on_change(ChangeType::kEnvironmentCreated, "conda:ml", 4, Clock::time_point{});

    std::ifstream            input(dir / "changes.jsonl");
    std::vector<std::string> lines;
    for (std::string line; std::getline(input, line);) {
        lines.push_back(line);
    }
    ASSERT_EQ(lines.size(), 2u);
    const auto first  = nlohmann::json::parse(lines[0]);
    const auto second = nlohmann::json::parse(lines[1]);
    EXPECT_EQ(first.at("decision"), "below_threshold");
    EXPECT_EQ(first.at("type"), "file_modified");
    EXPECT_EQ(second.at("decision"), "saved");
    EXPECT_EQ(second.at("score"), 4);
    EXPECT_EQ(second.at("path"), "conda:ml");
    std::filesystem::remove_all(dir);
}

TEST(TriggerDecisionName, CoversAllDecisions) {
    EXPECT_EQ(hyprsession::trigger_decision_name(TriggerDecision::kDeferred), "deferred");
    EXPECT_EQ(hyprsession::trigger_decision_name(TriggerDecision::kSaveFailed), "save_failed");
}
