#include "bulkup/transfer/concurrency.hpp"

#include <gtest/gtest.h>

using bulkup::transfer::ConcurrencyController;
using bulkup::transfer::NetworkQuality;
using bulkup::transfer::kMaxConcurrency;

TEST(ConcurrencyControllerTest, DefaultsToTwoWithoutHints) {
    ConcurrencyController controller(std::nullopt, std::nullopt);
    EXPECT_EQ(controller.current(), 2u);
    EXPECT_EQ(controller.ceiling(), kMaxConcurrency);
}

TEST(ConcurrencyControllerTest, MapsNetworkHint) {
    EXPECT_EQ(ConcurrencyController::initial(std::nullopt, NetworkQuality{25.0}), 6u);
    EXPECT_EQ(ConcurrencyController::initial(std::nullopt, NetworkQuality{20.0}), 6u);
    EXPECT_EQ(ConcurrencyController::initial(std::nullopt, NetworkQuality{10.0}), 4u);
    EXPECT_EQ(ConcurrencyController::initial(std::nullopt, NetworkQuality{2.0}), 2u);
    EXPECT_EQ(ConcurrencyController::initial(std::nullopt, NetworkQuality{0.5}), 1u);
    EXPECT_EQ(ConcurrencyController::initial(std::nullopt, NetworkQuality{0.0}), 1u);
}

TEST(ConcurrencyControllerTest, ExplicitMaximumWinsAndIsClamped) {
    EXPECT_EQ(ConcurrencyController::initial(3u, NetworkQuality{50.0}), 3u);
    EXPECT_EQ(ConcurrencyController::initial(32u, std::nullopt), kMaxConcurrency);

    ConcurrencyController controller(32u, std::nullopt);
    EXPECT_EQ(controller.ceiling(), kMaxConcurrency);
    EXPECT_EQ(controller.current(), kMaxConcurrency);
}

TEST(ConcurrencyControllerTest, FirstBatchOnlySetsBaseline) {
    ConcurrencyController controller(std::nullopt, std::nullopt);
    EXPECT_EQ(controller.on_batch_complete(1000.0), 2u);
    EXPECT_DOUBLE_EQ(controller.previous_throughput(), 1000.0);
}

TEST(ConcurrencyControllerTest, StepsUpAndDownByOne) {
    ConcurrencyController controller(std::nullopt, std::nullopt);
    controller.on_batch_complete(1000.0);

    EXPECT_EQ(controller.on_batch_complete(1200.0), 3u);  // > 115%
    EXPECT_EQ(controller.on_batch_complete(1300.0), 3u);  // within band
    EXPECT_EQ(controller.on_batch_complete(1000.0), 2u);  // < 85%
}

TEST(ConcurrencyControllerTest, StaysWithinBounds) {
    ConcurrencyController low(1u, std::nullopt);
    low.on_batch_complete(1000.0);
    EXPECT_EQ(low.on_batch_complete(10.0), 1u);
    EXPECT_EQ(low.on_batch_complete(10'000.0), 1u); // ceiling is 1

    ConcurrencyController high(std::nullopt, NetworkQuality{100.0});
    double rate = 1000.0;
    high.on_batch_complete(rate);
    for (int i = 0; i < 10; ++i) {
        rate *= 2.0;
        high.on_batch_complete(rate);
    }
    EXPECT_EQ(high.current(), kMaxConcurrency);
}
