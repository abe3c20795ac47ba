#include "runsync/transfer/key_lock.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using runsync::CancellationSource;
using runsync::CancellationToken;
using runsync::ErrorCode;
using runsync::transfer::KeyLockTable;

TEST(KeyLockTableTest, SameKeyIsExclusive) {
    KeyLockTable table;
    auto first = table.acquire("raw:c/r/f/tw/lb/ts", CancellationToken{}, std::chrono::milliseconds(100));
    ASSERT_TRUE(first.is_ok());

    auto second = table.acquire("raw:c/r/f/tw/lb/ts", CancellationToken{}, std::chrono::milliseconds(60));
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().code, ErrorCode::Cancelled);

    auto other = table.acquire("ml:c/r/f/tw/lb/ts", CancellationToken{}, std::chrono::milliseconds(60));
    EXPECT_TRUE(other.is_ok());
    EXPECT_EQ(table.size(), 2u);
}

TEST(KeyLockTableTest, ReleasedOnGuardDestruction) {
    KeyLockTable table;
    {
        auto guard = table.acquire("key", CancellationToken{}, std::chrono::milliseconds(100));
        ASSERT_TRUE(guard.is_ok());
        EXPECT_TRUE(guard.value().owns_lock());
    }
    EXPECT_TRUE(table.acquire("key", CancellationToken{}, std::chrono::milliseconds(100)).is_ok());
}

TEST(KeyLockTableTest, CancelledTokenStopsWaiting) {
    KeyLockTable table;
    auto held = table.acquire("key", CancellationToken{}, std::chrono::milliseconds(100));
    ASSERT_TRUE(held.is_ok());

    CancellationSource source;
    source.cancel();
    auto waited = table.acquire("key", source.token(), std::chrono::seconds(30));
    ASSERT_TRUE(waited.is_error());
    EXPECT_EQ(waited.error().code, ErrorCode::Cancelled);
}

TEST(KeyLockTableTest, SerializesConcurrentHolders) {
    KeyLockTable table;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto guard = table.acquire("key", CancellationToken{}, std::chrono::seconds(10));
            ASSERT_TRUE(guard.is_ok());
            const int now = ++inside;
            int seen = max_inside.load();
            while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --inside;
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(max_inside.load(), 1);
}
