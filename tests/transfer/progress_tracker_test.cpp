#include "bulkup/transfer/progress_tracker.hpp"

#include <gtest/gtest.h>

#include <chrono>

using bulkup::transfer::ProgressTracker;
using namespace std::chrono_literals;

TEST(ProgressTrackerTest, AccumulatesBytesAndPercent) {
    ProgressTracker tracker(1000);

    auto first = tracker.record_chunk(250, 100ms);
    EXPECT_EQ(first.bytes_uploaded, 250u);
    EXPECT_EQ(first.total_bytes, 1000u);
    EXPECT_EQ(first.percent_complete, 25);

    auto second = tracker.record_chunk(750, 100ms);
    EXPECT_EQ(second.bytes_uploaded, 1000u);
    EXPECT_EQ(second.percent_complete, 100);
    ASSERT_TRUE(second.eta_seconds.has_value());
    EXPECT_EQ(*second.eta_seconds, 0u);
}

TEST(ProgressTrackerTest, SpeedIsMeanOfChunkThroughputs) {
    ProgressTracker tracker(10'000);

    tracker.record_chunk(1000, 1s);
    tracker.record_chunk(3000, 1s);

    EXPECT_DOUBLE_EQ(tracker.speed_bytes_per_sec(), 2000.0);

    const auto entry = tracker.snapshot();
    ASSERT_TRUE(entry.eta_seconds.has_value());
    EXPECT_EQ(*entry.eta_seconds, 3u); // 6000 remaining at 2000 B/s
}

TEST(ProgressTrackerTest, FloorsDurationAtOneMillisecond) {
    ProgressTracker tracker(10'000);
    tracker.record_chunk(10, 0ms);
    EXPECT_DOUBLE_EQ(tracker.speed_bytes_per_sec(), 10'000.0);
}

TEST(ProgressTrackerTest, SpeedWindowDropsOldSamples) {
    ProgressTracker tracker(1'000'000);
    tracker.record_chunk(100'000, 1s);
    for (std::size_t i = 0; i < ProgressTracker::kSpeedWindow; ++i) {
        tracker.record_chunk(1000, 1s);
    }
    EXPECT_DOUBLE_EQ(tracker.speed_bytes_per_sec(), 1000.0);
}

TEST(ProgressTrackerTest, NeverExceedsTotal) {
    ProgressTracker tracker(100);
    auto entry = tracker.record_chunk(500, 10ms);
    EXPECT_EQ(entry.bytes_uploaded, 100u);
    EXPECT_EQ(entry.percent_complete, 100);
}

TEST(ProgressTrackerTest, NoEtaBeforeAnySpeed) {
    ProgressTracker tracker(100);
    const auto entry = tracker.snapshot();
    EXPECT_EQ(entry.percent_complete, 0);
    EXPECT_FALSE(entry.eta_seconds.has_value());
}

TEST(ProgressTrackerTest, EmptyTotalCountsAsComplete) {
    EXPECT_EQ(ProgressTracker::percent_of(0, 0), 100);
    EXPECT_EQ(ProgressTracker::percent_of(1, 3), 33);
    EXPECT_EQ(ProgressTracker::percent_of(2, 3), 67);
}
