#include <gtest/gtest.h>
#include "prewarm_pool.h"
#include "../support/fake_runtime.h"
#include "../support/manual_clock.h"
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace sandpool {
namespace {

class PrewarmPoolTest : public ::testing::Test {
protected:
    std::unique_ptr<PrewarmPool> make_pool(size_t target,
                                           std::chrono::milliseconds interval = std::chrono::milliseconds(20)) {
        PrewarmPool::Config config;
        config.target_size = target;
        config.replenish_interval = interval;
        return std::make_unique<PrewarmPool>(runtime, config, clock);
    }

    // Poll real time until the predicate holds
    template <typename Pred>
    bool eventually(Pred pred, std::chrono::milliseconds limit = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }

    FakeRuntime runtime;
    ManualClock clock;
};

// ============================================================================
// Replenish / Acquire
// ============================================================================

TEST_F(PrewarmPoolTest, ReplenishFillsToTarget) {
    auto pool = make_pool(3);

    EXPECT_EQ(pool->replenish(), 3u);
    EXPECT_EQ(pool->stats().idle, 3u);
    EXPECT_EQ(runtime.create_calls(), 3);
    EXPECT_EQ(runtime.start_calls(), 3);

    // At target nothing more is created
    EXPECT_EQ(pool->replenish(), 0u);
    EXPECT_EQ(runtime.create_calls(), 3);
}

TEST_F(PrewarmPoolTest, AcquireReservesIdleSandbox) {
    auto pool = make_pool(1);
    pool->replenish();

    auto handle = pool->acquire();
    ASSERT_TRUE(handle.has_value());

    auto info = pool->info(handle->id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, PoolState::RESERVED);
    EXPECT_EQ(pool->stats().idle, 0u);
    EXPECT_EQ(pool->stats().reserved, 1u);
}

TEST_F(PrewarmPoolTest, AcquireOnEmptyPoolReturnsNothing) {
    auto pool = make_pool(0);
    EXPECT_FALSE(pool->acquire().has_value());
    EXPECT_EQ(runtime.create_calls(), 0);
}

TEST_F(PrewarmPoolTest, AcquireIsFifo) {
    auto pool = make_pool(2);
    pool->replenish();

    auto first = pool->acquire();
    auto second = pool->acquire();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->id, "fake1");
    EXPECT_EQ(second->id, "fake2");
    EXPECT_FALSE(pool->acquire().has_value());
}

TEST_F(PrewarmPoolTest, CreatedWithConfiguredLimits) {
    PrewarmPool::Config config;
    config.target_size = 1;
    config.limits.memory_limit_bytes = 64 * 1024 * 1024;
    config.limits.cpu_quota_us = 25000;
    PrewarmPool pool(runtime, config, clock);
    pool.replenish();

    auto handle = pool.acquire();
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(handle->limits.memory_limit_bytes, 64u * 1024 * 1024);
    EXPECT_EQ(handle->limits.cpu_quota_us, 25000);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(PrewarmPoolTest, MarkExecutingBindsSession) {
    auto pool = make_pool(1);
    pool->replenish();
    auto handle = pool->acquire();

    EXPECT_TRUE(pool->mark_executing(handle->id, "session-1"));

    auto info = pool->info(handle->id);
    EXPECT_EQ(info->state, PoolState::EXECUTING);
    EXPECT_EQ(info->session_id, "session-1");

    // Only RESERVED may start executing
    EXPECT_FALSE(pool->mark_executing(handle->id, "session-2"));
}

TEST_F(PrewarmPoolTest, ReleaseRetiresAndDestroys) {
    auto pool = make_pool(1);
    pool->replenish();
    auto handle = pool->acquire();
    pool->mark_executing(handle->id, "s");

    pool->release(handle->id);

    auto info = pool->info(handle->id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, PoolState::RETIRED);
    EXPECT_TRUE(runtime.is_removed(handle->id));
    EXPECT_EQ(runtime.stop_calls(), 1);
    EXPECT_EQ(pool->stats().retired_total, 1u);
}

TEST_F(PrewarmPoolTest, ReleaseIsIdempotent) {
    auto pool = make_pool(1);
    pool->replenish();
    auto handle = pool->acquire();

    pool->release(handle->id);
    pool->release(handle->id);
    pool->release("never-existed");

    EXPECT_EQ(runtime.stop_calls(), 1);
    EXPECT_EQ(runtime.remove_calls(), 1);
    EXPECT_EQ(pool->stats().retired_total, 1u);
}

TEST_F(PrewarmPoolTest, RetiredSandboxNeverReturnsToIdle) {
    auto pool = make_pool(1);
    pool->replenish();
    auto handle = pool->acquire();
    pool->release(handle->id);

    // The slot is refilled with a fresh sandbox, never the released one
    pool->replenish();
    auto next = pool->acquire();
    ASSERT_TRUE(next.has_value());
    EXPECT_NE(next->id, handle->id);
    EXPECT_FALSE(pool->mark_executing(handle->id, "s"));
}

TEST_F(PrewarmPoolTest, AdoptTracksOnDemandSandbox) {
    auto pool = make_pool(0);
    SandboxHandle handle = runtime.create(ResourceLimits{});
    runtime.start(handle);

    pool->adopt(handle);

    EXPECT_EQ(pool->info(handle.id)->state, PoolState::RESERVED);
    EXPECT_TRUE(pool->mark_executing(handle.id, "s"));
    EXPECT_EQ(pool->stats().created_total, 1u);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(PrewarmPoolTest, CreateFailureLeavesPoolShort) {
    auto pool = make_pool(2);
    runtime.fail_next_creates(1, ErrorCode::ENGINE_UNAVAILABLE);

    EXPECT_EQ(pool->replenish(), 0u);
    EXPECT_EQ(pool->stats().creating, 0u);

    // Next pass recovers
    EXPECT_EQ(pool->replenish(), 2u);
}

TEST_F(PrewarmPoolTest, StartFailureRemovesCreatedContainer) {
    auto pool = make_pool(1);
    runtime.fail_next_starts(1, ErrorCode::RESOURCE_EXHAUSTED);

    EXPECT_EQ(pool->replenish(), 0u);
    EXPECT_EQ(runtime.live_count(), 0u);
    EXPECT_EQ(pool->stats().idle, 0u);
}

// ============================================================================
// Stale Sandboxes and Shutdown
// ============================================================================

TEST_F(PrewarmPoolTest, RetireStaleOnlyAfterHardTimeout) {
    auto pool = make_pool(2);
    pool->replenish();
    auto busy = pool->acquire();
    pool->mark_executing(busy->id, "s");

    clock.advance(std::chrono::seconds(30));
    EXPECT_TRUE(pool->retire_stale(std::chrono::seconds(40)).empty());

    clock.advance(std::chrono::seconds(11));
    auto retired = pool->retire_stale(std::chrono::seconds(40));

    // Idle sandboxes are not stale, however old
    ASSERT_EQ(retired.size(), 1u);
    EXPECT_EQ(retired[0], busy->id);
    EXPECT_EQ(pool->info(busy->id)->state, PoolState::RETIRED);
    EXPECT_EQ(pool->stats().idle, 1u);
}

TEST_F(PrewarmPoolTest, ShutdownRetiresEverything) {
    auto pool = make_pool(3);
    pool->replenish();

    pool->shutdown();

    EXPECT_EQ(pool->stats().idle, 0u);
    EXPECT_EQ(runtime.live_count(), 0u);
    EXPECT_FALSE(pool->acquire().has_value());
}

TEST_F(PrewarmPoolTest, DestructorLeavesNoContainers) {
    {
        auto pool = make_pool(2);
        pool->replenish();
    }
    EXPECT_EQ(runtime.live_count(), 0u);
}

// ============================================================================
// Background Replenisher
// ============================================================================

TEST_F(PrewarmPoolTest, BackgroundReplenisherRefills) {
    // Given: A running pool of two
    auto pool = make_pool(2);
    pool->start();
    ASSERT_TRUE(eventually([&] { return pool->stats().idle == 2; }));

    // When: One sandbox is taken
    auto handle = pool->acquire();
    ASSERT_TRUE(handle.has_value());

    // Then: The slot is refilled
    EXPECT_TRUE(eventually([&] { return pool->stats().idle == 2; }));
    EXPECT_EQ(runtime.create_calls(), 3);
    pool->stop();
}

TEST_F(PrewarmPoolTest, TriggerReplenishWakesWorker) {
    // Long interval: only an explicit trigger can fill the pool in time
    auto pool = make_pool(1, std::chrono::seconds(60));
    runtime.fail_next_creates(1, ErrorCode::ENGINE_UNAVAILABLE);
    pool->start();
    ASSERT_TRUE(eventually([&] { return runtime.create_calls() == 1; }));

    pool->trigger_replenish();

    EXPECT_TRUE(eventually([&] { return pool->stats().idle == 1; }));
    pool->stop();
}

TEST_F(PrewarmPoolTest, ConcurrentAcquireHandsOutEachSandboxOnce) {
    auto pool = make_pool(20);
    pool->replenish();

    std::mutex mutex;
    std::set<std::string> seen;
    std::atomic<int> duplicates{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&]() {
            while (auto handle = pool->acquire()) {
                std::lock_guard<std::mutex> lock(mutex);
                if (!seen.insert(handle->id).second) duplicates++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(seen.size(), 20u);
    EXPECT_EQ(duplicates.load(), 0);
}

TEST_F(PrewarmPoolTest, StateNames) {
    EXPECT_EQ(pool_state_to_string(PoolState::WARM_IDLE), "WARM_IDLE");
    EXPECT_EQ(pool_state_to_string(PoolState::RESERVED), "RESERVED");
    EXPECT_EQ(pool_state_to_string(PoolState::EXECUTING), "EXECUTING");
    EXPECT_EQ(pool_state_to_string(PoolState::RETIRED), "RETIRED");
}

} // namespace
} // namespace sandpool
