#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

#include <gtest/gtest.h>

#include "hyprsession/baseline.hpp"
#include "hyprsession/logging.hpp"

namespace {

    std::filesystem::path make_temp_dir() {
        const auto base   = std::filesystem::temp_directory_path();
        const auto unique = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" + std::to_string(std::random_device{}());
        auto       dir    = base / ("hyprsession_baseline_" + unique);
        std::filesystem::create_directories(dir);
        return dir;
    }

    void discard(std::string_view) {}

    std::string read_without_timestamp(const std::filesystem::path& path) {
        std::ifstream input(path);
        std::string   text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        const auto    timestamp = nlohmann::json::parse(text).at("timestamp").get<std::string>();
        if (const auto at = text.find(timestamp); at != std::string::npos) {
            text.erase(at, timestamp.size());
        }
        return text;
    }

    hyprsession::EnvironmentDescriptor env(const std::string& type, const std::string& name) {
        return hyprsession::EnvironmentDescriptor{.type = type, .name = name, .path = "/envs/" + name, .status = hyprsession::EnvironmentStatus::kAvailable};
    }

}

TEST(BaselineDiff, ReportsAddedAndRemovedIdentifiers) {
    const hyprsession::Baseline previous{.timestamp = "t0", .environments = {env("conda", "base"), env("venv", "old")}};
    const hyprsession::Baseline current{.timestamp = "t1", .environments = {env("conda", "base"), env("conda", "ml")}};

    const auto diff = hyprsession::diff_baselines(previous, current);

    EXPECT_EQ(diff.added, std::vector<std::string>{"conda:ml"});
    EXPECT_EQ(diff.removed, std::vector<std::string>{"venv:old"});

    const auto changes = hyprsession::diff_to_changes(diff);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].type, hyprsession::ChangeType::kEnvironmentCreated);
    EXPECT_EQ(changes[0].score, 4);
    EXPECT_EQ(changes[1].type, hyprsession::ChangeType::kEnvironmentDeleted);
    EXPECT_EQ(changes[1].score, 3);
}

TEST(BaselineJson, SortsEnvironmentsAndParsesBack) {
    const hyprsession::Baseline baseline{.timestamp = "t0", .environments = {env("venv", "b"), env("conda", "a")}};

    const auto json = hyprsession::baseline_to_json(baseline);
    EXPECT_EQ(json.at("environments").at(0).at("type"), "conda");

    std::string error;
    const auto  parsed = hyprsession::baseline_from_json(json, &error);
    ASSERT_TRUE(parsed.has_value()) << error;
    EXPECT_EQ(parsed->environments.size(), 2u);
    EXPECT_FALSE(hyprsession::baseline_from_json(nlohmann::json{{"environments", 3}}, &error).has_value());
    EXPECT_EQ(error, "invalid baseline");
}

TEST(BaselineTracker, FirstCycleEstablishesWithoutChanges) {
    const auto dir = make_temp_dir();
    hyprsession::BaselineTracker tracker(dir / "baseline.json", dir / "current.json", [] { return std::vector{env("conda", "base")}; });
    int                          emitted = 0;

    hyprsession::set_log_sink(discard);
    const auto result = tracker.run_cycle([&](const hyprsession::ClassifiedChange&) { ++emitted; });
    hyprsession::clear_log_sink();

    EXPECT_TRUE(result.established);
    EXPECT_EQ(result.environment_count, 1);
    EXPECT_EQ(emitted, 0);
    EXPECT_TRUE(tracker.has_baseline());
    EXPECT_TRUE(std::filesystem::exists(dir / "current.json"));
    EXPECT_EQ(tracker.state(), hyprsession::BaselineCycleState::kIdle);
    std::filesystem::remove_all(dir);
}

TEST(BaselineTracker, NewEnvironmentEmitsOnceThenSettles) {
    const auto                                      dir = make_temp_dir();
    std::vector<hyprsession::EnvironmentDescriptor> inventory{env("conda", "base")};
    hyprsession::BaselineTracker                    tracker(dir / "baseline.json", dir / "current.json", [&] { return inventory; });
    std::vector<hyprsession::ClassifiedChange>      emitted;
    const auto                                      sink = [&](const hyprsession::ClassifiedChange& change) { emitted.push_back(change); };

    hyprsession::set_log_sink(discard);
    tracker.run_cycle(sink);
    inventory.push_back(env("conda", "ml"));
    const auto second = tracker.run_cycle(sink);
    const auto third  = tracker.run_cycle(sink);
    hyprsession::clear_log_sink();

    EXPECT_FALSE(second.established);
    ASSERT_EQ(emitted.size(), 1u);
    EXPECT_EQ(emitted[0].event.path, "conda:ml");
    EXPECT_EQ(emitted[0].type, hyprsession::ChangeType::kEnvironmentCreated);
    EXPECT_EQ(emitted[0].score, 4);
    EXPECT_TRUE(third.diff.empty());
    std::filesystem::remove_all(dir);
}

TEST(BaselineTracker, UnchangedCyclesKeepBaselineStable) {
    const auto                   dir = make_temp_dir();
    hyprsession::BaselineTracker tracker(dir / "baseline.json", dir / "current.json",
                                         [] { return std::vector{env("venv", "api"), env("conda", "base"), env("pyenv", "3.12.1")}; });
    int                          emitted = 0;
    const auto                   sink    = [&](const hyprsession::ClassifiedChange&) { ++emitted; };

    hyprsession::set_log_sink(discard);
    ASSERT_TRUE(tracker.run_cycle(sink).established);
    const auto second      = tracker.run_cycle(sink);
    const auto after_first = read_without_timestamp(dir / "baseline.json");
    const auto third       = tracker.run_cycle(sink);
    const auto after_next  = read_without_timestamp(dir / "baseline.json");
    hyprsession::clear_log_sink();

    EXPECT_FALSE(second.error.has_value());
    EXPECT_TRUE(second.diff.empty());
    EXPECT_TRUE(third.diff.empty());
    EXPECT_TRUE(second.changes.empty());
    EXPECT_TRUE(third.changes.empty());
    EXPECT_EQ(emitted, 0);
    EXPECT_EQ(after_first, after_next);
    std::filesystem::remove_all(dir);
}

TEST(BaselineTracker, CorruptBaselineIsReestablished) {
    const auto dir = make_temp_dir();
    {
        std::ofstream output(dir / "baseline.json");
        output << "{broken";
    }
    hyprsession::BaselineTracker tracker(dir / "baseline.json", dir / "current.json", [] { return std::vector{env("venv", "api")}; });

    hyprsession::set_log_sink(discard);
    const auto result = tracker.run_cycle({});
    hyprsession::clear_log_sink();

    EXPECT_TRUE(result.established);
    EXPECT_TRUE(result.changes.empty());
    EXPECT_TRUE(tracker.has_baseline());
    std::filesystem::remove_all(dir);
}
