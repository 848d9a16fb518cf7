#include "bulkup/transfer/concurrency.hpp"

#include <algorithm>

namespace bulkup::transfer {
namespace {

std::uint32_t clamp_level(std::uint32_t value, std::uint32_t ceiling) {
    return std::max<std::uint32_t>(1, std::min(value, ceiling));
}

std::uint32_t from_hint(const NetworkQuality& hint) {
    if (hint.downlink_mbps >= 20.0) return 6;
    if (hint.downlink_mbps >= 8.0) return 4;
    if (hint.downlink_mbps >= 2.0) return 2;
    return 1;
}

} // namespace

ConcurrencyController::ConcurrencyController(std::optional<std::uint32_t> max_concurrency,
                                             const std::optional<NetworkQuality>& hint)
    : ceiling_(max_concurrency && *max_concurrency > 0 ? clamp_level(*max_concurrency, kMaxConcurrency)
                                                       : kMaxConcurrency),
      current_(clamp_level(initial(max_concurrency, hint), ceiling_)) {}

std::uint32_t ConcurrencyController::initial(std::optional<std::uint32_t> max_concurrency,
                                             const std::optional<NetworkQuality>& hint) {
    std::uint32_t level = kDefaultConcurrency;
    if (max_concurrency && *max_concurrency > 0) {
        level = *max_concurrency;
    } else if (hint) {
        level = from_hint(*hint);
    }
    return clamp_level(level, kMaxConcurrency);
}

std::uint32_t ConcurrencyController::on_batch_complete(double batch_bytes_per_sec) {
    if (previous_ > 0.0) {
        if (batch_bytes_per_sec > previous_ * kStepUpRatio && current_ < ceiling_) {
            ++current_;
        } else if (batch_bytes_per_sec < previous_ * kStepDownRatio && current_ > 1) {
            --current_;
        }
    }
    previous_ = batch_bytes_per_sec;
    return current_;
}

} // namespace bulkup::transfer
