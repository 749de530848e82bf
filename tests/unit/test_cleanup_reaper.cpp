#include <gtest/gtest.h>
#include "cleanup_reaper.h"
#include "errors.h"
#include "executor.h"
#include "../support/fake_runtime.h"
#include "../support/manual_clock.h"
#include <thread>

namespace sandpool {
namespace {

class CleanupReaperTest : public ::testing::Test {
protected:
    void SetUp() override {
        sessions = std::make_unique<SessionTable>(clock);

        PrewarmPool::Config pool_config;
        pool_config.target_size = 0;
        pool = std::make_unique<PrewarmPool>(runtime, pool_config, clock);

        executor = std::make_unique<Executor>(*sessions, *pool, runtime, Executor::Config(), clock);

        config.interval = std::chrono::milliseconds(20);
        config.retention = std::chrono::seconds(60);
        config.purge_after = std::chrono::seconds(300);
        config.sandbox_hard_timeout = std::chrono::seconds(40);
        reaper = std::make_unique<CleanupReaper>(*sessions, *pool, config, clock);
    }

    Payload script() {
        Payload payload;
        payload.filename = "main.py";
        payload.content = "print('hi')\n";
        return payload;
    }

    std::string finished_session() {
        std::string id = sessions->create();
        executor->run(id, script(), std::chrono::seconds(5));
        return id;
    }

    FakeRuntime runtime;
    ManualClock clock;
    CleanupReaper::Config config;
    std::unique_ptr<SessionTable> sessions;
    std::unique_ptr<PrewarmPool> pool;
    std::unique_ptr<Executor> executor;
    std::unique_ptr<CleanupReaper> reaper;
};

// ============================================================================
// Explicit Cleanup
// ============================================================================

TEST_F(CleanupReaperTest, CleanupRunningSessionStopsSandbox) {
    // Given: A session blocked mid-execution
    runtime.block_exec("started\n");
    std::string id = sessions->create();
    std::thread worker([&]() {
        executor->run(id, script(), std::chrono::seconds(30));
    });
    ASSERT_TRUE(runtime.wait_for_execs(1));

    // When: The client cleans it up
    reaper->cleanup(id);
    worker.join();

    // Then: The session ends CLEANED_UP, never COMPLETED or FAILED
    Session session = sessions->get(id);
    EXPECT_EQ(session.state, SessionState::CLEANED_UP);
    EXPECT_EQ(session.output, "started\n");
    EXPECT_TRUE(runtime.is_removed(session.sandbox_id));
    EXPECT_EQ(pool->info(session.sandbox_id)->state, PoolState::RETIRED);
    EXPECT_EQ(runtime.live_count(), 0u);
}

TEST_F(CleanupReaperTest, CleanupPendingSession) {
    std::string id = sessions->create();

    reaper->cleanup(id);

    EXPECT_EQ(sessions->get(id).state, SessionState::CLEANED_UP);
    EXPECT_EQ(runtime.stop_calls(), 0);
}

TEST_F(CleanupReaperTest, CleanupFinishedSessionDoesNotTouchRetiredSandbox) {
    std::string id = finished_session();
    ASSERT_EQ(sessions->get(id).state, SessionState::COMPLETED);
    int stops = runtime.stop_calls();

    reaper->cleanup(id);

    EXPECT_EQ(sessions->get(id).state, SessionState::CLEANED_UP);
    EXPECT_EQ(runtime.stop_calls(), stops);
}

TEST_F(CleanupReaperTest, CleanupIsIdempotent) {
    std::string id = finished_session();

    EXPECT_NO_THROW(reaper->cleanup(id));
    EXPECT_NO_THROW(reaper->cleanup(id));
    EXPECT_EQ(sessions->get(id).state, SessionState::CLEANED_UP);
}

TEST_F(CleanupReaperTest, CleanupUnknownSessionThrows) {
    EXPECT_THROW(reaper->cleanup("no-such-session"), SessionNotFoundError);
}

// ============================================================================
// Periodic Reaping
// ============================================================================

TEST_F(CleanupReaperTest, ReapsFinishedSessionsAfterRetention) {
    std::string done = finished_session();
    std::string pending = sessions->create();

    clock.advance(std::chrono::seconds(59));
    EXPECT_EQ(reaper->reap_once().sessions_cleaned, 0u);

    clock.advance(std::chrono::seconds(2));
    auto stats = reaper->reap_once();

    EXPECT_EQ(stats.sessions_cleaned, 1u);
    EXPECT_EQ(sessions->get(done).state, SessionState::CLEANED_UP);
    // Unfinished sessions are never reaped by age
    EXPECT_EQ(sessions->get(pending).state, SessionState::PENDING);
}

TEST_F(CleanupReaperTest, PollingKeepsResultAlive) {
    std::string id = finished_session();

    for (int i = 0; i < 5; i++) {
        clock.advance(std::chrono::seconds(50));
        sessions->get(id);
        reaper->reap_once();
    }

    EXPECT_EQ(sessions->get(id).state, SessionState::COMPLETED);
}

TEST_F(CleanupReaperTest, PurgesCleanedRecordsAfterGracePeriod) {
    std::string id = sessions->create();
    reaper->cleanup(id);

    clock.advance(std::chrono::seconds(299));
    EXPECT_EQ(reaper->reap_once().sessions_purged, 0u);
    EXPECT_EQ(sessions->size(), 1u);

    clock.advance(std::chrono::seconds(2));
    EXPECT_EQ(reaper->reap_once().sessions_purged, 1u);
    EXPECT_EQ(sessions->size(), 0u);
    EXPECT_THROW(sessions->get(id), SessionNotFoundError);
}

TEST_F(CleanupReaperTest, RetiresStuckSandboxes) {
    // Given: A sandbox held by an executor that never returned it
    SandboxHandle handle = runtime.create(ResourceLimits{});
    runtime.start(handle);
    pool->adopt(handle);
    pool->mark_executing(handle.id, "lost-session");

    // When: The hard timeout passes
    clock.advance(std::chrono::seconds(41));
    auto stats = reaper->reap_once();

    // Then: It is force-retired
    EXPECT_EQ(stats.sandboxes_retired, 1u);
    EXPECT_TRUE(runtime.is_removed(handle.id));
}

TEST_F(CleanupReaperTest, BackgroundThreadReaps) {
    std::string id = finished_session();
    clock.advance(std::chrono::seconds(61));

    reaper->start();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        bool cleaned = false;
        for (const auto& session : sessions->snapshot()) {
            if (session.id == id && session.state == SessionState::CLEANED_UP) cleaned = true;
        }
        if (cleaned) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    reaper->stop();

    EXPECT_EQ(sessions->get(id).state, SessionState::CLEANED_UP);
}

TEST_F(CleanupReaperTest, StopWithoutStartIsSafe) {
    EXPECT_NO_THROW(reaper->stop());
    reaper->start();
    reaper->stop();
    EXPECT_NO_THROW(reaper->stop());
}

} // namespace
} // namespace sandpool
