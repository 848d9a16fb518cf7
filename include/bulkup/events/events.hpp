/**
 * @file events.hpp
 * @brief Event types emitted over the lifetime of an upload
 *
 * WHY THIS FILE EXISTS:
 * The uploader reports lifecycle milestones without knowing who listens.
 * Logging and metrics subscribe to these events on an EventBus.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadStartedEvent, ChunkUploadedEvent
 */

#pragma once

#include "bulkup/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace bulkup::events {

// ════════════════════════════════════════════════════════
// Upload Lifecycle Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the file has been planned and dispatch begins
 *
 * WHO EMITS: ChunkedUploader::upload_file
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct UploadStartedEvent {
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t initial_concurrency = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after the sender accepted one chunk
 */
struct ChunkUploadedEvent {
    std::string file_name;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes = 0;
    double throughput_bytes_per_sec = 0.0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a batch moved the concurrency level up or down
 */
struct ConcurrencyChangedEvent {
    std::string file_name;
    std::uint32_t previous = 0;
    std::uint32_t current = 0;
    double batch_bytes_per_sec = 0.0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadCompletedEvent {
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a chunk failure (or a read error) aborted the file
 */
struct UploadFailedEvent {
    std::string file_name;
    std::uint64_t bytes_uploaded = 0;
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when the caller cancelled; distinct from failure
 */
struct UploadCancelledEvent {
    std::string file_name;
    std::uint64_t bytes_uploaded = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace bulkup::events
