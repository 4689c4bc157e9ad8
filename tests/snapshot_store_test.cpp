#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "hyprsession/logging.hpp"
#include "hyprsession/save_lock.hpp"
#include "hyprsession/snapshot_store.hpp"

namespace {

    std::filesystem::path make_temp_dir() {
        const auto         now = std::chrono::steady_clock::now().time_since_epoch().count();
        std::random_device rd;
        auto               dir = std::filesystem::temp_directory_path() / (std::string("hyprsession-store-") + std::to_string(now) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(dir);
        return dir;
    }

    hyprsession::SessionSnapshot snapshot_with_id(const std::string& id) {
        hyprsession::SessionSnapshot snapshot;
        snapshot.id        = id;
        snapshot.timestamp = "2026-01-01T12:00:00Z";
        snapshot.workspaces.push_back(hyprsession::WorkspaceInfo{.id = 1, .windows = 1});
        snapshot.windows.push_back(hyprsession::WindowInfo{.address = "0x1", .workspace_id = 1, .class_name = "kitty"});
        snapshot.active_workspace_id = 1;
        return snapshot;
    }

    void discard(std::string_view) {}

    size_t count_snapshots(const std::filesystem::path& root) {
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(root / "snapshots")) {
            (void)entry;
            ++count;
        }
        return count;
    }

} // namespace

TEST(SnapshotStore, EmptyStoreHasNoCurrentSession) {
    const auto                 root = make_temp_dir();
    hyprsession::SnapshotStore store(root / "session", 3);
    std::string                error;

    EXPECT_FALSE(store.load_current(&error).has_value());
    EXPECT_EQ(error, "no saved session");
    EXPECT_FALSE(store.status().exists);
    std::filesystem::remove_all(root);
}

TEST(SnapshotStore, WritePublishesAndLoads) {
    const auto                 root = make_temp_dir();
    hyprsession::SnapshotStore store(root, 3);
    std::string                error;

    const auto                 written = store.write(snapshot_with_id("20260101-120000-000"), &error);

    ASSERT_TRUE(written.has_value()) << error;
    const auto loaded = store.load_current(&error);
    ASSERT_TRUE(loaded.has_value()) << error;
    EXPECT_EQ(loaded->id, "20260101-120000-000");
    ASSERT_EQ(loaded->windows.size(), 1u);

    const auto status = store.status();
    EXPECT_TRUE(status.exists);
    EXPECT_EQ(status.id, "20260101-120000-000");
    EXPECT_EQ(status.file_count, 6);
    std::filesystem::remove_all(root);
}

TEST(SnapshotStore, InvalidSnapshotLeavesPreviousCurrent) {
    const auto                 root = make_temp_dir();
    hyprsession::SnapshotStore store(root, 3);
    std::string                error;
    ASSERT_TRUE(store.write(snapshot_with_id("20260101-120000-000"), &error).has_value());

    auto broken = snapshot_with_id("20260101-130000-000");
    broken.windows.push_back(hyprsession::WindowInfo{.address = "0x2", .workspace_id = 5});

    EXPECT_FALSE(store.write(broken, &error).has_value());
    EXPECT_NE(error.find("invalid snapshot"), std::string::npos);
    EXPECT_EQ(store.status().id, "20260101-120000-000");
    std::filesystem::remove_all(root);
}

TEST(SnapshotStore, PrunesOldSnapshots) {
    const auto                 root = make_temp_dir();
    hyprsession::SnapshotStore store(root, 2);
    std::string                error;

    ASSERT_TRUE(store.write(snapshot_with_id("20260101-120000-000"), &error).has_value());
    ASSERT_TRUE(store.write(snapshot_with_id("20260101-120001-000"), &error).has_value());
    ASSERT_TRUE(store.write(snapshot_with_id("20260101-120002-000"), &error).has_value());

    EXPECT_EQ(count_snapshots(root), 2u);
    EXPECT_FALSE(std::filesystem::exists(root / "snapshots" / "20260101-120000-000"));
    EXPECT_EQ(store.status().id, "20260101-120002-000");
    std::filesystem::remove_all(root);
}

TEST(SnapshotStore, DuplicateIdsGetSuffix) {
    const auto                 root = make_temp_dir();
    hyprsession::SnapshotStore store(root, 5);
    std::string                error;

    ASSERT_TRUE(store.write(snapshot_with_id("20260101-120000-000"), &error).has_value());
    const auto second = store.write(snapshot_with_id("20260101-120000-000"), &error);

    ASSERT_TRUE(second.has_value()) << error;
    EXPECT_EQ(second->filename(), "20260101-120000-000-1");
    std::filesystem::remove_all(root);
}

TEST(SnapshotStore, CleanRemovesEverything) {
    const auto                 root = make_temp_dir();
    hyprsession::SnapshotStore store(root / "session", 3);
    std::string                error;
    ASSERT_TRUE(store.write(snapshot_with_id("20260101-120000-000"), &error).has_value());

    EXPECT_FALSE(store.clean(root / "save.lock").has_value());
    EXPECT_FALSE(std::filesystem::exists(root / "session"));
    EXPECT_FALSE(store.status().exists);
    std::filesystem::remove_all(root);
}

TEST(SnapshotStore, TamperedFacetIsRejected) {
    const auto                 root = make_temp_dir();
    hyprsession::SnapshotStore store(root, 3);
    std::string                error;
    const auto                 written = store.write(snapshot_with_id("20260101-120000-000"), &error);
    ASSERT_TRUE(written.has_value()) << error;

    std::string text;
    {
        std::ifstream input(*written / "windows.json");
        text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    }
    const auto at = text.find("kitty");
    ASSERT_NE(at, std::string::npos);
    text.replace(at, 5, "xterm");
    {
        std::ofstream output(*written / "windows.json", std::ios::trunc);
        output << text;
    }

    hyprsession::set_log_sink(discard);
    const auto loaded = store.load_current(&error);
    hyprsession::clear_log_sink();

    EXPECT_FALSE(loaded.has_value());
    EXPECT_EQ(error, "snapshot integrity check failed: windows checksum mismatch");
    std::filesystem::remove_all(root);
}

TEST(SnapshotStore, CleanWaitsForInFlightSave) {
    const auto                 root = make_temp_dir();
    hyprsession::SnapshotStore store(root / "session", 3);
    std::string                error;
    ASSERT_TRUE(store.write(snapshot_with_id("20260101-120000-000"), &error).has_value());

    std::atomic<bool>          done = false;
    std::optional<std::string> result;
    std::jthread               cleaner;
    {
        const auto held = hyprsession::SaveLock::acquire(root / "save.lock");
        ASSERT_TRUE(held.has_value()) << held.error();
        cleaner = std::jthread([&] {
            result = store.clean(root / "save.lock");
            done   = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        EXPECT_FALSE(done.load());
        EXPECT_TRUE(store.status().exists);
    }
    cleaner.join();

    EXPECT_TRUE(done.load());
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(std::filesystem::exists(root / "session"));
    std::filesystem::remove_all(root);
}
