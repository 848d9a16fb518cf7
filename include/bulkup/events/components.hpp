/**
 * @file components.hpp
 * @brief Ready-made observers for upload events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * ChunkedUploader uploader(&bus);
 * // uploads are now logged and counted
 *
 * Both components unsubscribe on destruction, so they may be shorter-lived
 * than the bus.
 */

#pragma once

#include "bulkup/events/event_bus.hpp"
#include "bulkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace bulkup::events {

/**
 * @brief Logs every upload event through spdlog
 *
 * Chunk-level and concurrency events go to debug, lifecycle events to
 * info, failures to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        started_id_ = bus_.subscribe<UploadStartedEvent>([](const UploadStartedEvent& e) {
            spdlog::info("[UploadStarted] file={} bytes={} chunks={} concurrency={}",
                         e.file_name, e.total_bytes, e.total_chunks, e.initial_concurrency);
        });

        chunk_id_ = bus_.subscribe<ChunkUploadedEvent>([](const ChunkUploadedEvent& e) {
            spdlog::debug("[ChunkUploaded] file={} chunk={}/{} bytes={} rate={:.0f}B/s",
                          e.file_name, e.chunk_index + 1, e.total_chunks, e.bytes, e.throughput_bytes_per_sec);
        });

        concurrency_id_ = bus_.subscribe<ConcurrencyChangedEvent>([](const ConcurrencyChangedEvent& e) {
            spdlog::debug("[ConcurrencyChanged] file={} {} -> {} batch_rate={:.0f}B/s",
                          e.file_name, e.previous, e.current, e.batch_bytes_per_sec);
        });

        completed_id_ = bus_.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] file={} bytes={} duration={}ms",
                         e.file_name, e.total_bytes, e.duration.count());
        });

        failed_id_ = bus_.subscribe<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::warn("[UploadFailed] file={} uploaded={} kind={} error={}",
                         e.file_name, e.bytes_uploaded, to_string(e.error.code), e.error.message);
        });

        cancelled_id_ = bus_.subscribe<UploadCancelledEvent>([](const UploadCancelledEvent& e) {
            spdlog::info("[UploadCancelled] file={} uploaded={}", e.file_name, e.bytes_uploaded);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<UploadStartedEvent>(started_id_);
        bus_.unsubscribe<ChunkUploadedEvent>(chunk_id_);
        bus_.unsubscribe<ConcurrencyChangedEvent>(concurrency_id_);
        bus_.unsubscribe<UploadCompletedEvent>(completed_id_);
        bus_.unsubscribe<UploadFailedEvent>(failed_id_);
        bus_.unsubscribe<UploadCancelledEvent>(cancelled_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    EventBus::SubscriptionId started_id_ = 0;
    EventBus::SubscriptionId chunk_id_ = 0;
    EventBus::SubscriptionId concurrency_id_ = 0;
    EventBus::SubscriptionId completed_id_ = 0;
    EventBus::SubscriptionId failed_id_ = 0;
    EventBus::SubscriptionId cancelled_id_ = 0;
};

/**
 * @brief Counts uploads, chunks and bytes
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.get_stats();
 * spdlog::info("Chunks sent: {}", stats.chunks_sent.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> files_started{0};
        std::atomic<std::uint64_t> files_completed{0};
        std::atomic<std::uint64_t> files_failed{0};
        std::atomic<std::uint64_t> files_cancelled{0};
        std::atomic<std::uint64_t> chunks_sent{0};
        std::atomic<std::uint64_t> bytes_uploaded{0};
        std::atomic<std::uint64_t> concurrency_changes{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        started_id_ = bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.files_started++;
        });

        chunk_id_ = bus_.subscribe<ChunkUploadedEvent>([this](const ChunkUploadedEvent& e) {
            stats_.chunks_sent++;
            stats_.bytes_uploaded += e.bytes;
        });

        concurrency_id_ = bus_.subscribe<ConcurrencyChangedEvent>([this](const ConcurrencyChangedEvent&) {
            stats_.concurrency_changes++;
        });

        completed_id_ = bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.files_completed++;
        });

        failed_id_ = bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.files_failed++;
        });

        cancelled_id_ = bus_.subscribe<UploadCancelledEvent>([this](const UploadCancelledEvent&) {
            stats_.files_cancelled++;
        });
    }

    ~MetricsComponent() {
        bus_.unsubscribe<UploadStartedEvent>(started_id_);
        bus_.unsubscribe<ChunkUploadedEvent>(chunk_id_);
        bus_.unsubscribe<ConcurrencyChangedEvent>(concurrency_id_);
        bus_.unsubscribe<UploadCompletedEvent>(completed_id_);
        bus_.unsubscribe<UploadFailedEvent>(failed_id_);
        bus_.unsubscribe<UploadCancelledEvent>(cancelled_id_);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Files started:   {}", stats_.files_started.load());
        spdlog::info("  Files completed: {}", stats_.files_completed.load());
        spdlog::info("  Files failed:    {}", stats_.files_failed.load());
        spdlog::info("  Files cancelled: {}", stats_.files_cancelled.load());
        spdlog::info("  Chunks sent:     {}", stats_.chunks_sent.load());
        spdlog::info("  Bytes uploaded:  {}", stats_.bytes_uploaded.load());
        spdlog::info("  Concurrency adj: {}", stats_.concurrency_changes.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
    EventBus::SubscriptionId started_id_ = 0;
    EventBus::SubscriptionId chunk_id_ = 0;
    EventBus::SubscriptionId concurrency_id_ = 0;
    EventBus::SubscriptionId completed_id_ = 0;
    EventBus::SubscriptionId failed_id_ = 0;
    EventBus::SubscriptionId cancelled_id_ = 0;
};

} // namespace bulkup::events
