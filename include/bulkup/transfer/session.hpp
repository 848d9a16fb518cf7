#pragma once

#include "bulkup/core/result.hpp"
#include "bulkup/transfer/chunk_planner.hpp"
#include "bulkup/transfer/concurrency.hpp"
#include "bulkup/transfer/progress_tracker.hpp"
#include "bulkup/transfer/types.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace bulkup::transfer {

/**
 * @brief Mutable state of one file upload, owned by the scheduler
 *
 * Created when the upload starts, mutated by the batch loop and by chunk
 * completions on worker threads, discarded when the upload ends.
 */
class TransferSession {
public:
    TransferSession(std::string file_name, ChunkPlan plan, ConcurrencyController concurrency);

    [[nodiscard]] const std::string& file_name() const noexcept { return file_name_; }
    [[nodiscard]] const ChunkPlan& plan() const noexcept { return plan_; }
    [[nodiscard]] std::uint32_t total_chunks() const noexcept { return plan_.total_chunks(); }
    [[nodiscard]] TransferState state() const;

    Result<void> start();
    Result<void> transition_to(TransferState next_state);

    /**
     * @brief Record a file-fatal error; the first one recorded wins
     *
     * Safe to call from worker threads. The state moves to Failed (or
     * Cancelled for a cancellation error) when the scheduler finishes the
     * current batch.
     */
    void mark_failed(Error error);

    [[nodiscard]] bool failed() const noexcept { return failed_.load(std::memory_order_acquire); }
    [[nodiscard]] std::optional<Error> last_error() const;

    ProgressEntry record_chunk(std::uint32_t chunk_index,
                               std::uint64_t bytes,
                               std::chrono::steady_clock::duration duration);

    [[nodiscard]] ProgressEntry progress() const { return tracker_.snapshot(); }
    [[nodiscard]] std::uint64_t bytes_uploaded() const { return tracker_.bytes_uploaded(); }

    ConcurrencyController& concurrency() noexcept { return concurrency_; }
    [[nodiscard]] const ConcurrencyController& concurrency() const noexcept { return concurrency_; }

    [[nodiscard]] std::chrono::steady_clock::time_point started_at() const noexcept { return started_at_; }

private:
    [[nodiscard]] bool can_transition(TransferState target) const noexcept;

    std::string file_name_;
    ChunkPlan plan_;
    ConcurrencyController concurrency_;
    ProgressTracker tracker_;

    mutable std::mutex mutex_;
    TransferState state_ = TransferState::Idle;
    std::optional<Error> last_error_;
    std::atomic<bool> failed_{false};
    std::chrono::steady_clock::time_point started_at_{};
};

const char* to_string(TransferState state);

} // namespace bulkup::transfer
