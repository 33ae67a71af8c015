#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <vector>
#include "../src/core/time_engine.hpp"

using namespace vault_ledger;

TEST(LedgerClockTest, FollowsWallClockUntilPinned) {
    LedgerClock clock;
    EXPECT_FALSE(clock.is_pinned());
    auto wall = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    EXPECT_NEAR(static_cast<double>(clock.now_sec()), static_cast<double>(wall), 2.0);
}

TEST(LedgerClockTest, PinnedClockOnlyMovesExplicitly) {
    LedgerClock clock;
    clock.set_time_sec(1700000000);
    EXPECT_TRUE(clock.is_pinned());
    EXPECT_EQ(clock.now_sec(), 1700000000);
    clock.advance(std::chrono::seconds(301));
    EXPECT_EQ(clock.now_sec(), 1700000301);
    clock.follow_wall_clock();
    EXPECT_FALSE(clock.is_pinned());
}

TEST(LedgerClockTest, ConcurrentReadersSeeConsistentTime) {
    LedgerClock clock;
    clock.set_time_sec(1000);
    std::vector<std::thread> readers;
    std::atomic<bool> ok{true};
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&clock, &ok] {
            for (int j = 0; j < 1000; ++j) {
                auto t = clock.now_sec();
                if (t < 1000 || t > 2000) ok = false;
            }
        });
    }
    for (int j = 0; j < 1000; ++j) clock.advance(std::chrono::seconds(1));
    for (auto& t : readers) t.join();
    EXPECT_TRUE(ok.load());
    EXPECT_EQ(clock.now_sec(), 2000);
}
