#pragma once

#include "bulkup/core/result.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bulkup::transfer {

inline constexpr std::uint64_t kDefaultChunkSize = 512 * 1024;

enum class TransferState {
    Idle,
    Transferring,
    Complete,
    Failed,
    Cancelled
};

/**
 * @brief Payload handed to the chunk sender for one chunk
 */
struct ChunkEnvelope {
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::vector<std::uint8_t> data;
};

/**
 * @brief Per-file progress as exported to callers and the aggregator
 */
struct ProgressEntry {
    std::uint64_t bytes_uploaded = 0;
    std::uint64_t total_bytes = 0;
    int percent_complete = 0;
    double speed_bytes_per_sec = 0.0;
    std::optional<std::uint64_t> eta_seconds; ///< Absent until a speed is known
    std::optional<std::uint32_t> chunk_index; ///< Last completed chunk, if chunked
    std::optional<std::uint32_t> total_chunks;
};

/**
 * @brief on_progress payload: a file name plus its progress
 */
struct ProgressUpdate {
    std::string file_name;
    ProgressEntry progress;
};

/**
 * @brief Optional hint about link quality used to pick initial concurrency
 *
 * downlink_mbps == 0 means the hint exists but carries no measurement.
 */
struct NetworkQuality {
    double downlink_mbps = 0.0;
};

/**
 * @brief Shared cancellation flag
 *
 * The scheduler polls it between batches and before each send. Senders may
 * capture the same token to abort their own in-flight work.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

using ChunkSender = std::function<Result<void>(const ChunkEnvelope&)>;
using ProgressCallback = std::function<void(const ProgressUpdate&)>;
using FileCompleteCallback = std::function<void(const std::string&)>;

struct UploadOptions {
    std::uint64_t chunk_size = kDefaultChunkSize;
    std::optional<std::uint32_t> max_concurrency;
    std::optional<NetworkQuality> network_quality;
    std::shared_ptr<CancellationToken> cancel_token;
    ProgressCallback on_progress;
    FileCompleteCallback on_file_complete;
    bool adaptive = false; ///< Batch uploads take chunk size/concurrency from the aggregator
};

struct FailedUpload {
    std::string file_name;
    Error error;
};

struct BatchResult {
    std::vector<std::string> successful;
    std::vector<FailedUpload> failed;
};

} // namespace bulkup::transfer
