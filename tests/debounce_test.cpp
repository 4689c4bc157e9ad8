#include <chrono>

#include <gtest/gtest.h>

#include "hyprsession/debounce.hpp"

using Clock = std::chrono::steady_clock;

TEST(SaveDebounce, RunsImmediatelyWhenIdle) {
    hyprsession::SaveDebounce debounce(std::chrono::milliseconds(200));
    const auto                t0 = Clock::time_point{};

    EXPECT_TRUE(debounce.record_event(t0));
    EXPECT_FALSE(debounce.pending());
}

TEST(SaveDebounce, DefersWhenWithinInterval) {
    hyprsession::SaveDebounce debounce(std::chrono::milliseconds(200));
    const auto                t0 = Clock::time_point{};

    EXPECT_TRUE(debounce.record_event(t0));
    EXPECT_FALSE(debounce.record_event(t0 + std::chrono::milliseconds(100)));
    EXPECT_TRUE(debounce.pending());
    EXPECT_FALSE(debounce.flush(t0 + std::chrono::milliseconds(150)));
    EXPECT_TRUE(debounce.flush(t0 + std::chrono::milliseconds(300)));
    EXPECT_FALSE(debounce.pending());
}

TEST(SaveDebounce, FlushRequiresPendingEvent) {
    hyprsession::SaveDebounce debounce(std::chrono::milliseconds(100));
    const auto                t0 = Clock::time_point{};

    EXPECT_FALSE(debounce.flush(t0));
    EXPECT_TRUE(debounce.record_event(t0));
    EXPECT_FALSE(debounce.flush(t0 + std::chrono::milliseconds(500)));
}

TEST(SaveDebounce, ZeroIntervalNeverDefers) {
    hyprsession::SaveDebounce debounce(std::chrono::milliseconds(0));
    const auto                t0 = Clock::time_point{};

    EXPECT_TRUE(debounce.record_event(t0));
    EXPECT_TRUE(debounce.record_event(t0));
}
