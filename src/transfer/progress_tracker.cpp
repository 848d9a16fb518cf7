#include "bulkup/transfer/progress_tracker.hpp"

#include <algorithm>
#include <cmath>

namespace bulkup::transfer {

ProgressTracker::ProgressTracker(std::uint64_t total_bytes) : total_bytes_(total_bytes) {}

ProgressEntry ProgressTracker::record_chunk(std::uint64_t bytes, std::chrono::steady_clock::duration duration) {
    using seconds = std::chrono::duration<double>;
    const double elapsed = std::max(0.001, std::chrono::duration_cast<seconds>(duration).count());

    std::lock_guard lock(mutex_);
    bytes_uploaded_ = std::min(total_bytes_, bytes_uploaded_ + bytes);
    throughput_.push(static_cast<double>(bytes) / elapsed);
    return snapshot_locked();
}

ProgressEntry ProgressTracker::snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_locked();
}

std::uint64_t ProgressTracker::bytes_uploaded() const {
    std::lock_guard lock(mutex_);
    return bytes_uploaded_;
}

double ProgressTracker::speed_bytes_per_sec() const {
    std::lock_guard lock(mutex_);
    return throughput_.mean();
}

int ProgressTracker::percent_of(std::uint64_t done, std::uint64_t total) {
    if (total == 0) {
        return 100;
    }
    return static_cast<int>(std::lround(100.0 * static_cast<double>(done) / static_cast<double>(total)));
}

ProgressEntry ProgressTracker::snapshot_locked() const {
    ProgressEntry entry;
    entry.bytes_uploaded = bytes_uploaded_;
    entry.total_bytes = total_bytes_;
    entry.percent_complete = percent_of(bytes_uploaded_, total_bytes_);
    entry.speed_bytes_per_sec = throughput_.mean();

    if (entry.speed_bytes_per_sec > 0.0) {
        const auto remaining = static_cast<double>(total_bytes_ - bytes_uploaded_);
        entry.eta_seconds = static_cast<std::uint64_t>(std::llround(remaining / entry.speed_bytes_per_sec));
    }
    return entry;
}

} // namespace bulkup::transfer
