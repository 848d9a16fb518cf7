#include <gtest/gtest.h>
#include "bulkup/events/event_bus.hpp"
#include "bulkup/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace bulkup::events;

TEST(EventBus, DeliversToSubscribersOfTheType) {
    EventBus bus;

    std::string started;
    int chunks = 0;
    bus.subscribe<UploadStartedEvent>([&](const UploadStartedEvent& e) { started = e.file_name; });
    bus.subscribe<ChunkUploadedEvent>([&](const ChunkUploadedEvent&) { chunks++; });

    bus.emit(UploadStartedEvent{"a.bin", 100, 1, 2});
    bus.emit(ChunkUploadedEvent{"a.bin", 0, 1, 100, 1000.0});
    bus.emit(ChunkUploadedEvent{"a.bin", 0, 1, 100, 1000.0});

    EXPECT_EQ(started, "a.bin");
    EXPECT_EQ(chunks, 2);
}

TEST(EventBus, EmitWithoutSubscribersIsNoop) {
    EventBus bus;
    bus.emit(UploadCompletedEvent{"a.bin", 1, std::chrono::milliseconds(5)});
    EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 0u);
}

TEST(EventBus, UnsubscribeRemovesOnlyThatHandler) {
    EventBus bus;

    int first = 0;
    int second = 0;
    auto id = bus.subscribe<UploadFailedEvent>([&](const UploadFailedEvent&) { first++; });
    bus.subscribe<UploadFailedEvent>([&](const UploadFailedEvent&) { second++; });
    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 2u);

    bus.unsubscribe<UploadFailedEvent>(id);
    bus.emit(UploadFailedEvent{"a.bin", 0, bulkup::Error{bulkup::ErrorCode::ChunkTransfer, "boom"}});

    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 1u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int delivered = 0;
    bus.subscribe<UploadCancelledEvent>([](const UploadCancelledEvent&) {
        throw std::runtime_error("observer bug");
    });
    bus.subscribe<UploadCancelledEvent>([&](const UploadCancelledEvent&) { delivered++; });

    EXPECT_NO_THROW(bus.emit(UploadCancelledEvent{"a.bin", 10}));
    EXPECT_EQ(delivered, 1);
}

TEST(EventBus, HandlerMayUnsubscribeItself) {
    EventBus bus;

    int calls = 0;
    EventBus::SubscriptionId id = 0;
    id = bus.subscribe<ConcurrencyChangedEvent>([&](const ConcurrencyChangedEvent&) {
        calls++;
        bus.unsubscribe<ConcurrencyChangedEvent>(id);
    });

    bus.emit(ConcurrencyChangedEvent{"a.bin", 2, 3, 100.0});
    bus.emit(ConcurrencyChangedEvent{"a.bin", 3, 4, 200.0});
    EXPECT_EQ(calls, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;

    std::atomic<int> count{0};
    bus.subscribe<ChunkUploadedEvent>([&](const ChunkUploadedEvent&) { count++; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&bus, t]() {
            for (int i = 0; i < 100; ++i) {
                bus.emit(ChunkUploadedEvent{"f" + std::to_string(t), static_cast<std::uint32_t>(i), 100, 1, 1.0});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(count.load(), 800);
}

TEST(EventBus, ClearDropsAllHandlers) {
    EventBus bus;
    int calls = 0;
    bus.subscribe<UploadStartedEvent>([&](const UploadStartedEvent&) { calls++; });
    bus.clear();
    bus.emit(UploadStartedEvent{"a.bin", 1, 1, 1});
    EXPECT_EQ(calls, 0);
}
