// =============================================================================
// pdf-shrink - Session Locks Tests
// =============================================================================

#include "pds/session/session_locks.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

namespace pds::session {
namespace {

using namespace std::chrono_literals;

TEST(SessionLocksTest, EntriesAreReleasedWithTheLastGuard) {
    SessionLocks locks;
    EXPECT_EQ(locks.activeCount(), 0u);
    {
        auto a = locks.lockShared("aaaa");
        auto b = locks.lockShared("aaaa");
        auto c = locks.lockExclusive("bbbb");
        EXPECT_TRUE(a.ownsLock());
        EXPECT_FALSE(a.exclusive());
        EXPECT_TRUE(c.exclusive());
        EXPECT_EQ(locks.activeCount(), 2u);
    }
    EXPECT_EQ(locks.activeCount(), 0u);
}

TEST(SessionLocksTest, TryLockFailsWhileHeld) {
    SessionLocks locks;
    auto shared = locks.lockShared("s");
    EXPECT_FALSE(locks.tryLockExclusive("s").has_value());
    EXPECT_TRUE(locks.tryLockExclusive("other").has_value());

    shared.unlock();
    EXPECT_FALSE(shared.ownsLock());
    auto exclusive = locks.tryLockExclusive("s");
    ASSERT_TRUE(exclusive.has_value());
    EXPECT_TRUE(exclusive->ownsLock());
}

TEST(SessionLocksTest, MovedGuardReleasesOnce) {
    SessionLocks locks;
    SessionLocks::Guard outer;
    {
        auto inner = locks.lockExclusive("s");
        outer = std::move(inner);
        EXPECT_FALSE(inner.ownsLock());
    }
    EXPECT_TRUE(outer.ownsLock());
    EXPECT_FALSE(locks.tryLockExclusive("s").has_value());

    outer.unlock();
    EXPECT_TRUE(locks.tryLockExclusive("s").has_value());
    EXPECT_EQ(locks.activeCount(), 0u);
}

TEST(SessionLocksTest, ExclusiveWaitsForShared) {
    SessionLocks locks;
    std::atomic<bool> acquired{false};

    auto shared = locks.lockShared("s");
    std::thread writer([&] {
        auto guard = locks.lockExclusive("s");
        acquired = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());

    shared.unlock();
    writer.join();
    EXPECT_TRUE(acquired.load());
}

TEST(SessionLocksTest, ExclusiveHoldersNeverOverlap) {
    SessionLocks locks;
    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                auto guard = locks.lockExclusive("s");
                const int now = ++inside;
                int seen = maxInside.load();
                while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {
                }
                --inside;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(maxInside.load(), 1);
    EXPECT_EQ(locks.activeCount(), 0u);
}

}  // namespace
}  // namespace pds::session
