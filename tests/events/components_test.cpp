#include "bulkup/events/components.hpp"
#include "bulkup/events/event_bus.hpp"
#include "bulkup/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using bulkup::events::ChunkUploadedEvent;
using bulkup::events::ConcurrencyChangedEvent;
using bulkup::events::EventBus;
using bulkup::events::LoggerComponent;
using bulkup::events::MetricsComponent;
using bulkup::events::UploadCancelledEvent;
using bulkup::events::UploadCompletedEvent;
using bulkup::events::UploadFailedEvent;
using bulkup::events::UploadStartedEvent;

TEST(MetricsComponentTest, CountsUploadLifecycle) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(UploadStartedEvent{"a.bin", 2048, 2, 2});
    bus.emit(ChunkUploadedEvent{"a.bin", 0, 2, 1024, 5000.0});
    bus.emit(ChunkUploadedEvent{"a.bin", 1, 2, 1024, 6000.0});
    bus.emit(ConcurrencyChangedEvent{"a.bin", 2, 3, 9000.0});
    bus.emit(UploadCompletedEvent{"a.bin", 2048, std::chrono::milliseconds{200}});
    bus.emit(UploadFailedEvent{"b.bin", 0, bulkup::Error{bulkup::ErrorCode::ChunkTransfer, "rejected"}});
    bus.emit(UploadCancelledEvent{"c.bin", 512});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_started.load(), 1u);
    EXPECT_EQ(stats.chunks_sent.load(), 2u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 2048u);
    EXPECT_EQ(stats.concurrency_changes.load(), 1u);
    EXPECT_EQ(stats.files_completed.load(), 1u);
    EXPECT_EQ(stats.files_failed.load(), 1u);
    EXPECT_EQ(stats.files_cancelled.load(), 1u);
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<UploadStartedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<UploadStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ChunkUploadedEvent>(), 0u);

    EXPECT_NO_THROW(bus.emit(UploadStartedEvent{"a.bin", 1, 1, 1}));
}
