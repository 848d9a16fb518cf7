#pragma once

/**
 * @file aggregator.hpp
 * @brief One stable progress view across many concurrent file uploads
 *
 * WHY THIS FILE EXISTS:
 * A UI operation uploads many files, possibly in several sequential batches,
 * while per-file totals arrive late and finished files drop out of the live
 * set. Summing the live entries naively makes the overall percentage jump
 * backwards. The aggregator keeps the numerator and denominator stable.
 *
 * STABILITY RULES:
 * - max_observed_total never decreases until clear_progress()
 * - Bytes of removed entries stay counted as retired bytes
 * - reset_for_new_batch() retires live entries and drops tick timers, but
 *   keeps totals and speed history so the next batch continues smoothly
 *
 * THREAD SAFETY:
 * Every public method takes the same mutex, so each read sees one
 * consistent state. Uploads report from worker threads; the UI reads.
 *
 * EXAMPLE:
 * ProgressAggregator aggregator;
 * aggregator.set_total_bytes_to_upload(15 * 1024 * 1024);
 * aggregator.update_progress("a.bin", entry);
 * int percent = aggregator.overall_progress();
 */

#include "bulkup/core/rolling_average.hpp"
#include "bulkup/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace bulkup::progress {

using transfer::ProgressEntry;

/**
 * @brief All aggregate metrics read under one lock
 */
struct AggregateSnapshot {
    int percent = 0;
    int percent_clamped = 0;
    std::uint64_t loaded_bytes = 0;
    std::uint64_t stable_total = 0;
    double speed_bytes_per_sec = 0.0;
    double smoothed_speed_bytes_per_sec = 0.0;
    std::optional<std::uint64_t> eta_seconds;
    std::size_t live_files = 0;
};

class ProgressAggregator {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr std::size_t kSpeedBufferSize = 10;
    static constexpr std::size_t kDerivedSpeedSamples = 5;
    static constexpr double kEtaPreviousWeight = 0.85;
    static constexpr double kTargetChunkSeconds = 2.0;
    static constexpr std::uint64_t kMinChunkSize = 1ULL * 1024 * 1024;
    static constexpr std::uint64_t kMaxChunkSize = 100ULL * 1024 * 1024;

    ProgressAggregator();
    explicit ProgressAggregator(Clock clock);

    /**
     * @brief Declare the byte total of the whole operation up front
     */
    void set_total_bytes_to_upload(std::uint64_t bytes);

    /**
     * @brief Insert or replace the entry for file_name
     *
     * Also records a derived-speed tick, feeds the smoothed speed buffer and
     * advances the smoothed ETA.
     */
    void update_progress(const std::string& file_name, const ProgressEntry& entry);

    /**
     * @brief Drop a finished or cancelled file; its bytes stay counted
     */
    void remove_progress(const std::string& file_name);

    void reset_for_new_batch();
    void clear_progress();

    [[nodiscard]] int overall_progress() const;
    [[nodiscard]] int overall_progress_clamped() const;

    /**
     * @brief Sum of per-file speeds, or the tick-derived speed when none report one
     */
    [[nodiscard]] double overall_speed() const;
    [[nodiscard]] double smoothed_network_speed() const;

    /**
     * @brief Smoothed seconds remaining; 0 when done, empty while speed is unknown
     */
    [[nodiscard]] std::optional<std::uint64_t> overall_eta_seconds() const;

    /**
     * @brief About two seconds of transfer at the smoothed speed, within [1 MiB, 100 MiB]
     */
    [[nodiscard]] std::uint64_t recommended_chunk_size() const;

    /**
     * @brief Concurrent transfers for the smoothed speed, 1 to 8
     */
    [[nodiscard]] std::uint32_t recommended_concurrency() const;

    [[nodiscard]] AggregateSnapshot snapshot() const;

    [[nodiscard]] std::optional<ProgressEntry> entry(const std::string& file_name) const;
    [[nodiscard]] std::size_t file_count() const;
    [[nodiscard]] std::uint64_t total_bytes_to_upload() const;
    [[nodiscard]] std::uint64_t max_observed_total() const;

private:
    struct Totals {
        std::uint64_t loaded = 0;
        std::uint64_t stable_total = 0;
    };

    [[nodiscard]] Totals totals_locked() const;
    [[nodiscard]] int progress_locked() const;
    [[nodiscard]] double speed_locked() const;
    [[nodiscard]] std::optional<std::uint64_t> eta_locked() const;
    void observe_tick_locked();
    void observe_speed_locked();
    void retire_locked(const ProgressEntry& entry);

    Clock clock_;
    mutable std::mutex mutex_;

    std::unordered_map<std::string, ProgressEntry> entries_;
    std::uint64_t declared_total_ = 0;
    std::uint64_t max_observed_total_ = 0;
    std::uint64_t retired_bytes_ = 0;
    std::uint64_t retired_total_ = 0;

    std::optional<std::chrono::steady_clock::time_point> last_tick_;
    std::uint64_t last_loaded_ = 0;
    RollingAverage derived_samples_{kDerivedSpeedSamples};
    double derived_speed_ = 0.0;

    RollingAverage speed_buffer_{kSpeedBufferSize};
    std::optional<double> smoothed_eta_;
};

} // namespace bulkup::progress
