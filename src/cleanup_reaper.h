#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include "clock.h"
#include "prewarm_pool.h"
#include "session_table.h"

namespace sandpool {

// Reclaims sandboxes and retires session records.
//
// Explicit cleanup is the only path that can abort a RUNNING session: it
// commits CLEANED_UP first, so an executor finishing at the same moment
// finds the session terminal and its write becomes a no-op. The periodic
// pass reaps finished sessions nobody polled for `retention`, purges
// CLEANED_UP records after `purge_after`, and force-retires sandboxes held
// longer than `sandbox_hard_timeout` (an executor that died mid-job).
class CleanupReaper {
public:
    struct Config {
        std::chrono::milliseconds interval;
        std::chrono::milliseconds retention;
        std::chrono::milliseconds purge_after;
        std::chrono::milliseconds sandbox_hard_timeout;

        Config() :
            interval(std::chrono::seconds(DEFAULT_REAP_INTERVAL_SECONDS)),
            retention(std::chrono::seconds(DEFAULT_RETENTION_SECONDS)),
            purge_after(std::chrono::seconds(DEFAULT_PURGE_AFTER_SECONDS)),
            sandbox_hard_timeout(std::chrono::seconds(
                DEFAULT_TIMEOUT_SECONDS + SANDBOX_HARD_TIMEOUT_GRACE_SECONDS)) {}
    };

    struct ReapStats {
        size_t sessions_cleaned = 0;
        size_t sessions_purged = 0;
        size_t sandboxes_retired = 0;
    };

    CleanupReaper(SessionTable& sessions, PrewarmPool& pool,
                  const Config& config = Config(), Clock& clock = SteadyClock::instance());
    ~CleanupReaper();

    CleanupReaper(const CleanupReaper&) = delete;
    CleanupReaper& operator=(const CleanupReaper&) = delete;

    // Force a session to CLEANED_UP, stopping its sandbox if still bound.
    // Throws SessionNotFoundError; calling it again is harmless.
    void cleanup(const std::string& session_id);

    // One time-based pass
    ReapStats reap_once();

    void start();
    void stop();

private:
    void reap_loop();

    SessionTable& sessions_;
    PrewarmPool& pool_;
    Config config_;
    Clock& clock_;

    std::mutex mutex_;
    std::condition_variable wake_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace sandpool
