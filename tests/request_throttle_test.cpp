#include <gtest/gtest.h>
#include "../src/core/request_throttle.hpp"

using namespace vault_ledger;

TEST(RequestThrottleTest, AllowsWithinLimit) {
    RequestThrottle throttle(5, std::chrono::seconds(1));
    auto t0 = RequestThrottle::Clock::now();
    int allowed = 0;
    for (int i = 0; i < 5; ++i) {
        if (throttle.allow_at("bot", t0)) ++allowed;
    }
    EXPECT_EQ(allowed, 5);
    EXPECT_FALSE(throttle.allow_at("bot", t0));
    EXPECT_EQ(throttle.remaining("bot", t0), 0u);
    // Budgets are per key.
    EXPECT_TRUE(throttle.allow_at("admin", t0));
}

TEST(RequestThrottleTest, ResetsAfterWindow) {
    RequestThrottle throttle(2, std::chrono::seconds(60));
    auto t0 = RequestThrottle::Clock::now();
    EXPECT_TRUE(throttle.allow_at("k", t0));
    EXPECT_TRUE(throttle.allow_at("k", t0 + std::chrono::seconds(1)));
    EXPECT_FALSE(throttle.allow_at("k", t0 + std::chrono::seconds(59)));
    EXPECT_TRUE(throttle.allow_at("k", t0 + std::chrono::seconds(60)));
    EXPECT_EQ(throttle.remaining("k", t0 + std::chrono::seconds(61)), 1u);
}

TEST(RequestThrottleTest, ZeroLimitDisablesThrottling) {
    RequestThrottle throttle(0);
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(throttle.allow("anyone"));
    }
    EXPECT_EQ(throttle.tracked_keys(), 0u);
}

TEST(RequestThrottleTest, PruneDropsExpiredKeys) {
    RequestThrottle throttle(3, std::chrono::seconds(10));
    auto t0 = RequestThrottle::Clock::now();
    throttle.allow_at("a", t0);
    throttle.allow_at("b", t0 + std::chrono::seconds(8));
    EXPECT_EQ(throttle.prune(t0 + std::chrono::seconds(11)), 1u);
    EXPECT_EQ(throttle.tracked_keys(), 1u);
}

TEST(RequestThrottleTest, ExpiredKeysAreSweptWhileServing) {
    RequestThrottle throttle(3, std::chrono::seconds(60));
    auto t0 = RequestThrottle::Clock::now();
    for (size_t i = 0; i + 1 < RequestThrottle::PRUNE_EVERY; ++i) {
        EXPECT_TRUE(throttle.allow_at("caller-" + std::to_string(i), t0));
    }
    EXPECT_EQ(throttle.tracked_keys(), RequestThrottle::PRUNE_EVERY - 1);

    // The next call lands after every window has expired and triggers a sweep.
    EXPECT_TRUE(throttle.allow_at("late", t0 + std::chrono::seconds(61)));
    EXPECT_EQ(throttle.tracked_keys(), 1u);
}

TEST(RequestThrottleTest, TableSizeIsCapped) {
    RequestThrottle throttle(3, std::chrono::seconds(60), 4);
    auto t0 = RequestThrottle::Clock::now();
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(throttle.allow_at("k" + std::to_string(i), t0));
    }
    EXPECT_FALSE(throttle.allow_at("fresh", t0));
    EXPECT_EQ(throttle.tracked_keys(), 4u);
    // Known keys keep their budget.
    EXPECT_TRUE(throttle.allow_at("k0", t0));
    // Once the old windows lapse there is room again.
    EXPECT_TRUE(throttle.allow_at("fresh", t0 + std::chrono::seconds(60)));
    EXPECT_EQ(throttle.tracked_keys(), 1u);
}
