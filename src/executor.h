#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "clock.h"
#include "payload.h"
#include "prewarm_pool.h"
#include "sandbox_runtime.h"
#include "session_table.h"

namespace sandpool {

// Bounded exponential backoff for transient engine errors
struct RetryPolicy {
    int max_attempts = DEFAULT_RETRY_ATTEMPTS;         // Total tries, including the first
    std::chrono::milliseconds initial_backoff{DEFAULT_RETRY_BACKOFF_MS};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{MAX_RETRY_BACKOFF_MS};

    // Delay after the given failed attempt (1-based)
    std::chrono::milliseconds backoff_after(int attempt) const;
};

// Drives submissions end to end. submit() records a PENDING session and
// returns its id at once; worker threads then acquire a sandbox, stream
// output into the session and complete it. The sandbox is released on
// every path.
class Executor {
public:
    struct Config {
        size_t workers;
        std::chrono::milliseconds default_timeout;
        ResourceLimits limits;                         // For sandboxes created on demand
        RetryPolicy retry;

        Config() :
            workers(DEFAULT_WORKERS),
            default_timeout(std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS)) {}
    };

    Executor(SessionTable& sessions, PrewarmPool& pool, SandboxRuntime& runtime,
             const Config& config = Config(), Clock& clock = SteadyClock::instance());
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Queue a payload; returns the new session id without waiting
    std::string submit(const Payload& payload);
    std::string submit(const Payload& payload, std::chrono::milliseconds timeout);

    // Execute one session on the calling thread
    void run(const std::string& session_id, const Payload& payload,
             std::chrono::milliseconds timeout);

    void start();

    // Stop workers; sessions still queued are failed
    void stop();

    size_t pending() const;

private:
    struct Job {
        std::string session_id;
        Payload payload;
        std::chrono::milliseconds timeout{0};
    };

    // Warm sandbox if one is idle, else create one with retries.
    // Throws the last PoolError once retries are exhausted.
    SandboxHandle acquire_sandbox(const std::string& session_id);
    void discard(const SandboxHandle& handle);
    void worker_loop();

    SessionTable& sessions_;
    PrewarmPool& pool_;
    SandboxRuntime& runtime_;
    Config config_;
    Clock& clock_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Job> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
};

} // namespace sandpool
