#include <gtest/gtest.h>
#include "executor.h"
#include "errors.h"
#include "../support/fake_runtime.h"
#include "../support/manual_clock.h"
#include <thread>
#include <vector>

namespace sandpool {
namespace {

Payload hello_payload() {
    Payload payload;
    payload.filename = "main.py";
    payload.content = "print('hello')\n";
    return payload;
}

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        sessions = std::make_unique<SessionTable>(clock);
        make_pool(0);
        make_executor();
    }

    void make_pool(size_t target) {
        executor.reset();
        PrewarmPool::Config config;
        config.target_size = target;
        pool = std::make_unique<PrewarmPool>(runtime, config, clock);
    }

    void make_executor(size_t workers = 2) {
        Executor::Config config;
        config.workers = workers;
        config.default_timeout = std::chrono::seconds(5);
        executor = std::make_unique<Executor>(*sessions, *pool, runtime, config, clock);
    }

    // Run one payload synchronously on this thread
    Session run_once(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::string id = sessions->create();
        executor->run(id, hello_payload(), timeout);
        return sessions->get(id);
    }

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
    std::unique_ptr<SessionTable> sessions;
    std::unique_ptr<PrewarmPool> pool;
    std::unique_ptr<Executor> executor;
};

// ============================================================================
// Retry Policy
// ============================================================================

TEST(RetryPolicyTest, ExponentialBackoffIsCapped) {
    RetryPolicy policy;
    policy.initial_backoff = std::chrono::milliseconds(200);
    policy.multiplier = 2.0;
    policy.max_backoff = std::chrono::milliseconds(1000);

    EXPECT_EQ(policy.backoff_after(1).count(), 200);
    EXPECT_EQ(policy.backoff_after(2).count(), 400);
    EXPECT_EQ(policy.backoff_after(3).count(), 800);
    EXPECT_EQ(policy.backoff_after(4).count(), 1000);
    EXPECT_EQ(policy.backoff_after(50).count(), 1000);
}

// ============================================================================
// Execution Outcomes
// ============================================================================

TEST_F(ExecutorTest, HelloScriptCompletes) {
    Session session = run_once();

    EXPECT_EQ(session.state, SessionState::COMPLETED);
    EXPECT_EQ(session.output, "hello\n");
    EXPECT_EQ(session.exit_code, 0);
    EXPECT_FALSE(session.sandbox_id.empty());

    // Single use: the sandbox is gone once the session finishes
    EXPECT_TRUE(runtime.is_removed(session.sandbox_id));
    EXPECT_EQ(pool->info(session.sandbox_id)->state, PoolState::RETIRED);
    EXPECT_TRUE(runtime.violations().empty());
}

TEST_F(ExecutorTest, NonZeroExitStillCompletes) {
    runtime.set_output("Traceback (most recent call last):\nValueError\n", 1);

    Session session = run_once();

    EXPECT_EQ(session.state, SessionState::COMPLETED);
    EXPECT_EQ(session.exit_code, 1);
    EXPECT_NE(session.output.find("ValueError"), std::string::npos);
}

TEST_F(ExecutorTest, StreamedChunksKeepOrder) {
    runtime.set_exec_behavior([](const SandboxHandle&, const Payload&,
                                 std::chrono::milliseconds, const ChunkSink& sink) {
        for (int i = 0; i < 100; i++) sink(std::to_string(i) + "\n");
        return ExecResult{};
    });

    Session session = run_once();

    std::string expected;
    for (int i = 0; i < 100; i++) expected += std::to_string(i) + "\n";
    EXPECT_EQ(session.output, expected);
}

TEST_F(ExecutorTest, TimeoutFailsSessionWithPartialOutput) {
    // Given: A script that prints once and then never finishes
    runtime.block_exec("partial\n");

    // When: Running with a short bound
    Session session = run_once(std::chrono::milliseconds(100));

    // Then: Failed with the partial output and the reason, sandbox reclaimed
    EXPECT_EQ(session.state, SessionState::FAILED);
    EXPECT_EQ(session.error, "Timeout");
    EXPECT_EQ(session.output.rfind("partial\n[sandpool] Timeout: ", 0), 0u);
    EXPECT_TRUE(runtime.is_removed(session.sandbox_id));
}

TEST_F(ExecutorTest, CrashIsNeverRetried) {
    runtime.set_exec_behavior([](const SandboxHandle&, const Payload&,
                                 std::chrono::milliseconds, const ChunkSink&) -> ExecResult {
        throw SandboxCrashedError("process killed by signal 9 (memory limit or forced stop)");
    });

    Session session = run_once();

    EXPECT_EQ(session.state, SessionState::FAILED);
    EXPECT_EQ(session.error, "SandboxCrashed");
    EXPECT_NE(session.output.find("[sandpool] Sandbox crashed: process killed by signal 9"),
              std::string::npos);
    EXPECT_EQ(runtime.exec_calls(), 1);
    EXPECT_TRUE(clock.sleeps().empty());
}

// ============================================================================
// Sandbox Acquisition
// ============================================================================

TEST_F(ExecutorTest, PrefersWarmSandbox) {
    make_pool(1);
    make_executor();
    pool->replenish();
    ASSERT_EQ(runtime.create_calls(), 1);

    Session session = run_once();

    EXPECT_EQ(session.state, SessionState::COMPLETED);
    EXPECT_EQ(session.sandbox_id, "fake1");
    EXPECT_EQ(runtime.create_calls(), 1);
}

TEST_F(ExecutorTest, CreatesOnDemandWhenPoolIsEmpty) {
    Session session = run_once();

    EXPECT_EQ(session.state, SessionState::COMPLETED);
    EXPECT_EQ(runtime.create_calls(), 1);
    EXPECT_EQ(runtime.start_calls(), 1);
    EXPECT_EQ(pool->stats().created_total, 1u);
}

TEST_F(ExecutorTest, TransientCreateFailuresAreRetriedWithBackoff) {
    // Given: The engine fails twice, then recovers
    runtime.fail_next_creates(2, ErrorCode::ENGINE_UNAVAILABLE);

    // When: A session runs
    Session session = run_once();

    // Then: Third attempt succeeds after 200ms and 400ms backoff
    EXPECT_EQ(session.state, SessionState::COMPLETED);
    EXPECT_EQ(runtime.create_calls(), 3);
    auto sleeps = clock.sleeps();
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0].count(), 200);
    EXPECT_EQ(sleeps[1].count(), 400);
}

TEST_F(ExecutorTest, ExhaustedRetriesFailTheSession) {
    runtime.fail_next_creates(5, ErrorCode::RESOURCE_EXHAUSTED);

    Session session = run_once();

    EXPECT_EQ(session.state, SessionState::FAILED);
    EXPECT_EQ(session.error, "ResourceExhausted");
    EXPECT_TRUE(session.sandbox_id.empty());
    EXPECT_NE(session.output.find("[sandpool] Resource exhausted: create failed"), std::string::npos);
    EXPECT_EQ(runtime.create_calls(), DEFAULT_RETRY_ATTEMPTS);
    EXPECT_EQ(clock.sleeps().size(), static_cast<size_t>(DEFAULT_RETRY_ATTEMPTS - 1));
    EXPECT_EQ(runtime.exec_calls(), 0);
}

TEST_F(ExecutorTest, StartFailureDiscardsContainer) {
    runtime.fail_next_starts(1, ErrorCode::ENGINE_UNAVAILABLE);

    Session session = run_once();

    // First container failed to start and was removed; the retry succeeded
    EXPECT_EQ(session.state, SessionState::COMPLETED);
    EXPECT_TRUE(runtime.is_removed("fake1"));
    EXPECT_EQ(session.sandbox_id, "fake2");
    EXPECT_EQ(runtime.live_count(), 0u);
}

TEST_F(ExecutorTest, NonTransientStartFailureIsNotRetried) {
    runtime.fail_next_starts(1, ErrorCode::SANDBOX_CRASHED);

    Session session = run_once();

    EXPECT_EQ(session.state, SessionState::FAILED);
    EXPECT_EQ(session.error, "SandboxCrashed");
    EXPECT_EQ(runtime.create_calls(), 1);
    EXPECT_TRUE(clock.sleeps().empty());
    EXPECT_EQ(runtime.live_count(), 0u);
}

TEST_F(ExecutorTest, UnexpectedStartErrorStillDiscardsContainer) {
    // Given: start fails with something other than an engine error
    runtime.crash_next_start("Failed to fork process: Resource temporarily unavailable");

    // When
    Session session = run_once();

    // Then: The created container is removed, not leaked
    EXPECT_EQ(session.state, SessionState::FAILED);
    EXPECT_EQ(runtime.create_calls(), 1);
    EXPECT_TRUE(runtime.is_removed("fake1"));
    EXPECT_EQ(runtime.live_count(), 0u);
    EXPECT_FALSE(pool->info("fake1").has_value());
}

TEST_F(ExecutorTest, HostLimitAtStartIsRetried) {
    runtime.fail_next_starts(1, ErrorCode::RESOURCE_EXHAUSTED);

    Session session = run_once();

    EXPECT_EQ(session.state, SessionState::COMPLETED);
    EXPECT_EQ(runtime.create_calls(), 2);
    EXPECT_EQ(clock.sleeps().size(), 1u);
    EXPECT_EQ(runtime.live_count(), 0u);
}

TEST_F(ExecutorTest, CleanedBeforeStartSkipsExecution) {
    std::string id = sessions->create();
    sessions->mark_cleaned(id);

    executor->run(id, hello_payload(), std::chrono::seconds(5));

    EXPECT_EQ(sessions->get(id).state, SessionState::CLEANED_UP);
    EXPECT_EQ(runtime.exec_calls(), 0);
    EXPECT_EQ(runtime.live_count(), 0u);
}

// ============================================================================
// Worker Pool
// ============================================================================

TEST_F(ExecutorTest, WorkersDrainQueue) {
    // Given: Two workers
    executor->start();

    // When: Ten sessions are submitted
    std::vector<std::string> ids;
    for (int i = 0; i < 10; i++) {
        ids.push_back(executor->submit(hello_payload()));
    }

    // Then: All complete, at most two at once, each in its own sandbox
    EXPECT_TRUE(eventually([&] {
        for (const auto& id : ids) {
            if (sessions->get(id).state != SessionState::COMPLETED) return false;
        }
        return true;
    }));
    EXPECT_LE(runtime.max_concurrent_execs(), 2);
    EXPECT_EQ(runtime.exec_calls(), 10);
    EXPECT_TRUE(runtime.violations().empty());
    EXPECT_EQ(runtime.live_count(), 0u);
    executor->stop();
}

TEST_F(ExecutorTest, SubmitReturnsPendingSessionImmediately) {
    std::string id = executor->submit(hello_payload());

    Session session = sessions->get(id);
    EXPECT_EQ(session.state, SessionState::PENDING);
    EXPECT_EQ(session.payload_sha256, hello_payload().sha256());
    EXPECT_EQ(executor->pending(), 1u);
}

TEST_F(ExecutorTest, StopFailsQueuedSessions) {
    std::string a = executor->submit(hello_payload());
    std::string b = executor->submit(hello_payload());

    executor->stop();

    for (const auto& id : {a, b}) {
        Session session = sessions->get(id);
        EXPECT_EQ(session.state, SessionState::FAILED);
        EXPECT_NE(session.output.find("[sandpool] service shutting down"), std::string::npos);
    }
    EXPECT_EQ(executor->pending(), 0u);
    EXPECT_EQ(runtime.create_calls(), 0);
}

} // namespace
} // namespace sandpool
