#include "bulkup/progress/aggregator.hpp"

#include <algorithm>
#include <cmath>

namespace bulkup::progress {
namespace {

constexpr double kMiB = 1024.0 * 1024.0;

std::uint64_t loaded_of(const ProgressEntry& entry) {
    return std::min(entry.bytes_uploaded, entry.total_bytes);
}

} // namespace

ProgressAggregator::ProgressAggregator()
    : ProgressAggregator([] { return std::chrono::steady_clock::now(); }) {}

ProgressAggregator::ProgressAggregator(Clock clock) : clock_(std::move(clock)) {}

void ProgressAggregator::set_total_bytes_to_upload(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    declared_total_ = bytes;
    max_observed_total_ = std::max(max_observed_total_, bytes);
}

void ProgressAggregator::update_progress(const std::string& file_name, const ProgressEntry& entry) {
    std::lock_guard lock(mutex_);
    entries_[file_name] = entry;
    max_observed_total_ = std::max(max_observed_total_, entry.total_bytes);
    // Pin the denominator so a later shrink of the live set cannot lower it.
    max_observed_total_ = std::max(max_observed_total_, totals_locked().stable_total);
    observe_tick_locked();
    observe_speed_locked();
}

void ProgressAggregator::remove_progress(const std::string& file_name) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(file_name);
    if (it == entries_.end()) {
        return;
    }
    retire_locked(it->second);
    entries_.erase(it);
}

void ProgressAggregator::reset_for_new_batch() {
    std::lock_guard lock(mutex_);
    for (const auto& [name, entry] : entries_) {
        retire_locked(entry);
    }
    entries_.clear();
    last_tick_.reset();
    last_loaded_ = 0;
}

void ProgressAggregator::clear_progress() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    declared_total_ = 0;
    max_observed_total_ = 0;
    retired_bytes_ = 0;
    retired_total_ = 0;
    last_tick_.reset();
    last_loaded_ = 0;
    derived_samples_.clear();
    derived_speed_ = 0.0;
    speed_buffer_.clear();
    smoothed_eta_.reset();
}

int ProgressAggregator::overall_progress() const {
    std::lock_guard lock(mutex_);
    return progress_locked();
}

int ProgressAggregator::overall_progress_clamped() const {
    std::lock_guard lock(mutex_);
    return std::clamp(progress_locked(), 0, 100);
}

double ProgressAggregator::overall_speed() const {
    std::lock_guard lock(mutex_);
    return speed_locked();
}

double ProgressAggregator::smoothed_network_speed() const {
    std::lock_guard lock(mutex_);
    return speed_buffer_.mean();
}

std::optional<std::uint64_t> ProgressAggregator::overall_eta_seconds() const {
    std::lock_guard lock(mutex_);
    return eta_locked();
}

std::uint64_t ProgressAggregator::recommended_chunk_size() const {
    std::lock_guard lock(mutex_);
    const double target = speed_buffer_.mean() * kTargetChunkSeconds;
    const double clamped = std::clamp(target, static_cast<double>(kMinChunkSize), static_cast<double>(kMaxChunkSize));
    return static_cast<std::uint64_t>(clamped);
}

std::uint32_t ProgressAggregator::recommended_concurrency() const {
    std::lock_guard lock(mutex_);
    const double speed = speed_buffer_.mean();
    if (speed > 100 * kMiB) return 8;
    if (speed > 50 * kMiB) return 6;
    if (speed > 20 * kMiB) return 5;
    if (speed > 10 * kMiB) return 4;
    if (speed > 5 * kMiB) return 3;
    if (speed > 1 * kMiB) return 2;
    return 1;
}

AggregateSnapshot ProgressAggregator::snapshot() const {
    std::lock_guard lock(mutex_);
    const auto totals = totals_locked();
    AggregateSnapshot snap;
    snap.percent = progress_locked();
    snap.percent_clamped = std::clamp(snap.percent, 0, 100);
    snap.loaded_bytes = totals.loaded;
    snap.stable_total = totals.stable_total;
    snap.speed_bytes_per_sec = speed_locked();
    snap.smoothed_speed_bytes_per_sec = speed_buffer_.mean();
    snap.eta_seconds = eta_locked();
    snap.live_files = entries_.size();
    return snap;
}

std::optional<ProgressEntry> ProgressAggregator::entry(const std::string& file_name) const {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(file_name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ProgressAggregator::file_count() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::uint64_t ProgressAggregator::total_bytes_to_upload() const {
    std::lock_guard lock(mutex_);
    return declared_total_;
}

std::uint64_t ProgressAggregator::max_observed_total() const {
    std::lock_guard lock(mutex_);
    return max_observed_total_;
}

ProgressAggregator::Totals ProgressAggregator::totals_locked() const {
    std::uint64_t live_loaded = 0;
    std::uint64_t live_total = 0;
    for (const auto& [name, entry] : entries_) {
        live_loaded += loaded_of(entry);
        live_total += entry.total_bytes;
    }

    const std::uint64_t grand_total = declared_total_ > 0 ? declared_total_ : retired_total_ + live_total;
    Totals totals;
    totals.loaded = retired_bytes_ + live_loaded;
    totals.stable_total = std::max(grand_total, max_observed_total_);
    return totals;
}

int ProgressAggregator::progress_locked() const {
    const auto totals = totals_locked();
    if (totals.stable_total > 0) {
        const auto safe_loaded = std::min(totals.loaded, totals.stable_total);
        return static_cast<int>(std::lround(100.0 * static_cast<double>(safe_loaded) /
                                            static_cast<double>(totals.stable_total)));
    }
    if (entries_.empty()) {
        return 0;
    }

    // Only zero-byte files so far: average what they report.
    double sum = 0.0;
    for (const auto& [name, entry] : entries_) {
        sum += entry.percent_complete;
    }
    return static_cast<int>(std::lround(sum / static_cast<double>(entries_.size())));
}

double ProgressAggregator::speed_locked() const {
    double summed = 0.0;
    for (const auto& [name, entry] : entries_) {
        summed += entry.speed_bytes_per_sec;
    }
    return summed > 0.0 ? summed : derived_speed_;
}

std::optional<std::uint64_t> ProgressAggregator::eta_locked() const {
    const auto totals = totals_locked();
    if (totals.loaded >= totals.stable_total) {
        return 0;
    }
    if (speed_buffer_.mean() <= 0.0 || !smoothed_eta_) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::llround(*smoothed_eta_));
}

void ProgressAggregator::observe_tick_locked() {
    const auto now = clock_();
    const auto loaded = totals_locked().loaded;

    if (last_tick_) {
        const double dt = std::chrono::duration<double>(now - *last_tick_).count();
        if (dt > 0.0) {
            const double delta = loaded > last_loaded_ ? static_cast<double>(loaded - last_loaded_) : 0.0;
            derived_samples_.push(delta / dt);
            derived_speed_ = derived_samples_.mean();
        }
    }

    last_loaded_ = loaded;
    last_tick_ = now;
}

void ProgressAggregator::observe_speed_locked() {
    const double current = speed_locked();
    if (current > 0.0) {
        speed_buffer_.push(current);
    }

    const auto totals = totals_locked();
    if (totals.loaded >= totals.stable_total) {
        return;
    }
    const double speed = speed_buffer_.mean();
    if (speed <= 0.0) {
        return;
    }
    const double instantaneous = static_cast<double>(totals.stable_total - totals.loaded) / speed;
    smoothed_eta_ = smoothed_eta_ ? *smoothed_eta_ * kEtaPreviousWeight + instantaneous * (1.0 - kEtaPreviousWeight)
                                  : instantaneous;
}

void ProgressAggregator::retire_locked(const ProgressEntry& entry) {
    retired_bytes_ += loaded_of(entry);
    retired_total_ += entry.total_bytes;
}

} // namespace bulkup::progress
