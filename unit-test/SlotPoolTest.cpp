#include <atomic>
#include <thread>
#include <vector>
#include "gtest/gtest.h"
#include "worker/slot_pool.hpp"

using namespace std;
using namespace dcx::worker;

TEST(SlotPoolTest, CapacityMustBePositive) {
    EXPECT_THROW(slot_pool(0), invalid_argument);
}

TEST(SlotPoolTest, TryAcquireRespectsCapacity) {
    slot_pool pool(2);
    EXPECT_TRUE(pool.try_acquire());
    EXPECT_TRUE(pool.try_acquire());
    EXPECT_FALSE(pool.try_acquire());
    EXPECT_EQ(pool.available(), 0);

    pool.release();
    EXPECT_EQ(pool.available(), 1);
    pool.release();
    pool.release();
    EXPECT_EQ(pool.available(), 2);
}

TEST(SlotPoolTest, AcquireBlocksUntilRelease) {
    slot_pool pool(1);
    pool.acquire();

    atomic<bool> acquired{false};
    thread waiter([&] {
        pool.acquire();
        acquired = true;
        pool.release();
    });

    this_thread::sleep_for(chrono::milliseconds(50));
    EXPECT_FALSE(acquired);
    pool.release();
    waiter.join();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(pool.available(), 1);
}

TEST(SlotPoolTest, ConcurrencyNeverExceedsCapacity) {
    slot_pool pool(3);
    atomic<int> running{0}, peak{0};
    vector<thread> threads;
    for (int i = 0; i < 12; ++i)
        threads.emplace_back([&] {
            pool.acquire();
            slot_guard guard(pool);
            int now = ++running;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            this_thread::sleep_for(chrono::milliseconds(10));
            --running;
        });
    for (auto &t : threads) t.join();

    EXPECT_LE(peak, 3);
    EXPECT_EQ(pool.available(), 3);
}
