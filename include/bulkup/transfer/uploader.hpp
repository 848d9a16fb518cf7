#pragma once

/**
 * @file uploader.hpp
 * @brief Chunked file upload with adaptive per-file concurrency
 *
 * WHY THIS FILE EXISTS:
 * The remote endpoint only accepts bounded request sizes, so a file is split
 * into chunks and pushed through a caller-supplied sender. Sending several
 * chunks at once hides round-trip latency; how many at once is tuned from
 * the throughput each batch achieves.
 *
 * HOW IT WORKS:
 * 1. Plan chunk boundaries (plan_chunks)
 * 2. Take min(concurrency, remaining) chunks as a batch, read their bytes
 * 3. Post one send per chunk to the worker pool, wait for all of them
 * 4. Each success updates the per-file tracker and calls on_progress
 * 5. Compare the batch's throughput to the previous batch, adjust concurrency
 * 6. Stop at the first failure or when cancellation is observed
 *
 * FAILURE POLICY:
 * A single chunk failure aborts the file. Nothing is retried here; retrying
 * the whole file is the caller's decision.
 *
 * EXAMPLE:
 * ChunkedUploader uploader;
 * UploadOptions options;
 * options.on_progress = [](const ProgressUpdate& u) { ... };
 * if (!uploader.upload_file(file, sender, options)) {
 *     spdlog::warn("upload failed: {}", uploader.last_error()->message);
 * }
 */

#include "bulkup/events/event_bus.hpp"
#include "bulkup/transfer/file_source.hpp"
#include "bulkup/transfer/session.hpp"
#include "bulkup/transfer/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace bulkup::transfer {

class ChunkedUploader {
public:
    explicit ChunkedUploader(events::EventBus* bus = nullptr);
    ~ChunkedUploader();

    ChunkedUploader(const ChunkedUploader&) = delete;
    ChunkedUploader& operator=(const ChunkedUploader&) = delete;

    /**
     * @brief Upload one file through `sender`
     *
     * Returns true when every chunk was accepted (immediately for a zero-byte
     * file). On false, last_error() tells a cancellation
     * (ErrorCode::Cancelled) apart from a failure. on_file_complete runs only
     * on success.
     */
    bool upload_file(const std::shared_ptr<FileSource>& file,
                     const ChunkSender& sender,
                     const UploadOptions& options = {});

    [[nodiscard]] std::optional<Error> last_error() const;
    [[nodiscard]] bool is_uploading() const noexcept { return uploading_.load(); }

private:
    Result<void> transfer(FileSource& file, const ChunkSender& sender, const UploadOptions& options);

    Result<void> run_batches(TransferSession& session,
                             FileSource& file,
                             const ChunkSender& sender,
                             const UploadOptions& options);

    void send_chunk(TransferSession& session,
                    const ChunkSender& sender,
                    const UploadOptions& options,
                    const ChunkEnvelope& envelope);

    Result<void> finish(TransferSession& session, const UploadOptions& options);

    void report_progress(const UploadOptions& options, ProgressUpdate update);
    void notify_complete(const UploadOptions& options, const std::string& file_name);

    void set_last_error(std::optional<Error> error);

    boost::asio::thread_pool pool_;
    events::EventBus* bus_;

    std::mutex progress_mutex_; // keeps on_progress calls ordered per file
    mutable std::mutex error_mutex_;
    std::optional<Error> last_error_;
    std::atomic<bool> uploading_{false};
};

} // namespace bulkup::transfer
