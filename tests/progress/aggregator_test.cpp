#include "bulkup/progress/aggregator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>

using bulkup::progress::ProgressAggregator;
using bulkup::transfer::ProgressEntry;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

ProgressEntry entry_of(std::uint64_t uploaded, std::uint64_t total, double speed = 0.0) {
    ProgressEntry entry;
    entry.bytes_uploaded = uploaded;
    entry.total_bytes = total;
    entry.percent_complete = total == 0 ? 100 : static_cast<int>(100 * uploaded / total);
    entry.speed_bytes_per_sec = speed;
    return entry;
}

// Manually advanced clock for derived speed and ETA.
struct FakeClock {
    std::chrono::steady_clock::time_point now{};

    ProgressAggregator::Clock fn() {
        return [this] { return now; };
    }

    void advance(std::chrono::milliseconds by) { now += by; }
};

} // namespace

TEST(ProgressAggregatorTest, EmptyAggregatorReportsZero) {
    ProgressAggregator aggregator;
    EXPECT_EQ(aggregator.overall_progress(), 0);
    EXPECT_DOUBLE_EQ(aggregator.overall_speed(), 0.0);
    EXPECT_EQ(aggregator.file_count(), 0u);
}

TEST(ProgressAggregatorTest, CombinesLiveEntries) {
    ProgressAggregator aggregator;
    aggregator.update_progress("a", entry_of(50, 100, 10.0));
    aggregator.update_progress("b", entry_of(25, 100, 5.0));

    EXPECT_EQ(aggregator.overall_progress(), 38); // 75 / 200
    EXPECT_DOUBLE_EQ(aggregator.overall_speed(), 15.0);
    EXPECT_EQ(aggregator.file_count(), 2u);
}

TEST(ProgressAggregatorTest, RemovingFinishedFileKeepsPercent) {
    ProgressAggregator aggregator;
    aggregator.update_progress("a", entry_of(100, 100));
    aggregator.update_progress("b", entry_of(50, 100));
    EXPECT_EQ(aggregator.overall_progress(), 75);

    aggregator.remove_progress("a");
    EXPECT_EQ(aggregator.overall_progress(), 75);
    EXPECT_EQ(aggregator.file_count(), 1u);

    aggregator.update_progress("b", entry_of(100, 100));
    EXPECT_EQ(aggregator.overall_progress(), 100);
}

TEST(ProgressAggregatorTest, SecondBatchNeverDropsBelowFirst) {
    ProgressAggregator aggregator;
    aggregator.set_total_bytes_to_upload(15 * kMiB);

    for (std::uint64_t done = 0; done <= 10 * kMiB; done += kMiB) {
        aggregator.update_progress("first.bin", entry_of(done, 10 * kMiB));
    }
    const int end_of_first = aggregator.overall_progress();
    EXPECT_EQ(end_of_first, 67);

    aggregator.reset_for_new_batch();
    EXPECT_GE(aggregator.overall_progress(), end_of_first);

    int previous = end_of_first;
    for (std::uint64_t done = 0; done <= 5 * kMiB; done += kMiB / 2) {
        aggregator.update_progress("second.bin", entry_of(done, 5 * kMiB));
        const int now = aggregator.overall_progress();
        EXPECT_GE(now, previous);
        previous = now;
    }
    EXPECT_EQ(previous, 100);
}

TEST(ProgressAggregatorTest, MaxObservedTotalNeverShrinks) {
    ProgressAggregator aggregator;
    aggregator.update_progress("a", entry_of(0, 1000));
    aggregator.update_progress("a", entry_of(0, 400));
    EXPECT_EQ(aggregator.max_observed_total(), 1000u);
    EXPECT_EQ(aggregator.overall_progress(), 0);

    aggregator.update_progress("a", entry_of(400, 400));
    EXPECT_EQ(aggregator.overall_progress(), 40);
}

TEST(ProgressAggregatorTest, ZeroByteFilesAverageTheirPercent) {
    ProgressAggregator aggregator;
    aggregator.update_progress("empty", entry_of(0, 0));
    EXPECT_EQ(aggregator.overall_progress(), 100);
}

TEST(ProgressAggregatorTest, ClearProgressForgetsEverything) {
    ProgressAggregator aggregator;
    aggregator.set_total_bytes_to_upload(1000);
    aggregator.update_progress("a", entry_of(500, 1000, 100.0));
    aggregator.clear_progress();

    EXPECT_EQ(aggregator.overall_progress(), 0);
    EXPECT_EQ(aggregator.total_bytes_to_upload(), 0u);
    EXPECT_EQ(aggregator.max_observed_total(), 0u);
    EXPECT_DOUBLE_EQ(aggregator.smoothed_network_speed(), 0.0);
    EXPECT_EQ(aggregator.file_count(), 0u);
}

TEST(ProgressAggregatorTest, DerivesSpeedFromTicksWhenEntriesReportNone) {
    FakeClock clock;
    ProgressAggregator aggregator(clock.fn());
    aggregator.set_total_bytes_to_upload(10'000);

    aggregator.update_progress("a", entry_of(1000, 10'000));
    EXPECT_DOUBLE_EQ(aggregator.overall_speed(), 0.0);
    EXPECT_FALSE(aggregator.overall_eta_seconds().has_value());

    clock.advance(std::chrono::seconds(1));
    aggregator.update_progress("a", entry_of(2000, 10'000));
    EXPECT_DOUBLE_EQ(aggregator.overall_speed(), 1000.0);
    EXPECT_DOUBLE_EQ(aggregator.smoothed_network_speed(), 1000.0);
    ASSERT_TRUE(aggregator.overall_eta_seconds().has_value());
    EXPECT_EQ(*aggregator.overall_eta_seconds(), 8u);

    clock.advance(std::chrono::seconds(1));
    aggregator.update_progress("a", entry_of(3000, 10'000));
    // 0.85 * 8 + 0.15 * 7 = 7.85
    EXPECT_EQ(*aggregator.overall_eta_seconds(), 8u);
}

TEST(ProgressAggregatorTest, EtaIsZeroWhenDone) {
    ProgressAggregator aggregator;
    aggregator.update_progress("a", entry_of(100, 100, 50.0));
    ASSERT_TRUE(aggregator.overall_eta_seconds().has_value());
    EXPECT_EQ(*aggregator.overall_eta_seconds(), 0u);
}

TEST(ProgressAggregatorTest, RecommendationsFollowSmoothedSpeed) {
    FakeClock clock;
    ProgressAggregator aggregator(clock.fn());

    EXPECT_EQ(aggregator.recommended_concurrency(), 1u);
    EXPECT_EQ(aggregator.recommended_chunk_size(), ProgressAggregator::kMinChunkSize);

    aggregator.update_progress("a", entry_of(0, 1000 * kMiB, 3.0 * kMiB));
    EXPECT_EQ(aggregator.recommended_concurrency(), 2u);
    EXPECT_EQ(aggregator.recommended_chunk_size(), 6 * kMiB);

    aggregator.clear_progress();
    aggregator.update_progress("a", entry_of(0, 1000 * kMiB, 30.0 * kMiB));
    EXPECT_EQ(aggregator.recommended_concurrency(), 5u);

    aggregator.clear_progress();
    aggregator.update_progress("a", entry_of(0, 1000 * kMiB, 200.0 * kMiB));
    EXPECT_EQ(aggregator.recommended_concurrency(), 8u);
    EXPECT_EQ(aggregator.recommended_chunk_size(), ProgressAggregator::kMaxChunkSize);
}

TEST(ProgressAggregatorTest, SnapshotMatchesIndividualReads) {
    ProgressAggregator aggregator;
    aggregator.set_total_bytes_to_upload(400);
    aggregator.update_progress("a", entry_of(100, 200, 20.0));

    const auto snap = aggregator.snapshot();
    EXPECT_EQ(snap.percent, aggregator.overall_progress());
    EXPECT_EQ(snap.loaded_bytes, 100u);
    EXPECT_EQ(snap.stable_total, 400u);
    EXPECT_DOUBLE_EQ(snap.speed_bytes_per_sec, 20.0);
    EXPECT_EQ(snap.live_files, 1u);
}
