#pragma once

#include "bulkup/core/rolling_average.hpp"
#include "bulkup/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>

namespace bulkup::transfer {

/**
 * @brief Accumulates uploaded bytes for one file and smooths its throughput
 *
 * THREAD SAFETY:
 * record_chunk() is called from worker threads as chunks of a batch complete;
 * all state is guarded by one mutex.
 */
class ProgressTracker {
public:
    static constexpr std::size_t kSpeedWindow = 8;

    explicit ProgressTracker(std::uint64_t total_bytes);

    /**
     * @brief Account a completed chunk and return the updated entry
     *
     * Instantaneous throughput is bytes / duration, with the duration floored
     * at one millisecond.
     */
    ProgressEntry record_chunk(std::uint64_t bytes, std::chrono::steady_clock::duration duration);

    [[nodiscard]] ProgressEntry snapshot() const;

    [[nodiscard]] std::uint64_t bytes_uploaded() const;
    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return total_bytes_; }
    [[nodiscard]] double speed_bytes_per_sec() const;

    static int percent_of(std::uint64_t done, std::uint64_t total);

private:
    ProgressEntry snapshot_locked() const;

    const std::uint64_t total_bytes_;
    mutable std::mutex mutex_;
    std::uint64_t bytes_uploaded_ = 0;
    RollingAverage throughput_{kSpeedWindow};
};

} // namespace bulkup::transfer
