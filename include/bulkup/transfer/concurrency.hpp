#pragma once

#include "bulkup/transfer/types.hpp"

#include <cstdint>
#include <optional>

namespace bulkup::transfer {

inline constexpr std::uint32_t kMaxConcurrency = 8;
inline constexpr std::uint32_t kDefaultConcurrency = 2;
inline constexpr double kStepUpRatio = 1.15;
inline constexpr double kStepDownRatio = 0.85;

/**
 * @brief Per-file concurrency level tuned from batch throughput
 *
 * The level stays within [1, ceiling()] where the ceiling is
 * min(max_concurrency, 8). Adjusted at most once per batch.
 */
class ConcurrencyController {
public:
    ConcurrencyController(std::optional<std::uint32_t> max_concurrency,
                          const std::optional<NetworkQuality>& hint);

    /**
     * @brief Starting level before any throughput is known
     *
     * Explicit max_concurrency wins; otherwise the hint maps
     * >=20 Mbps -> 6, >=8 -> 4, >=2 -> 2, anything else -> 1; with neither the
     * default is 2. Always clamped to [1, 8].
     */
    static std::uint32_t initial(std::optional<std::uint32_t> max_concurrency,
                                 const std::optional<NetworkQuality>& hint);

    /**
     * @brief Feed one batch's average throughput; returns the new level
     *
     * Above 115% of the previous batch steps up by one, below 85% steps down
     * by one. The first batch only establishes the baseline.
     */
    std::uint32_t on_batch_complete(double batch_bytes_per_sec);

    [[nodiscard]] std::uint32_t current() const noexcept { return current_; }
    [[nodiscard]] std::uint32_t ceiling() const noexcept { return ceiling_; }
    [[nodiscard]] double previous_throughput() const noexcept { return previous_; }

private:
    std::uint32_t ceiling_;
    std::uint32_t current_;
    double previous_ = 0.0;
};

} // namespace bulkup::transfer
