#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "clock.h"
#include "sandbox_runtime.h"

namespace sandpool {

enum class PoolState {
    WARM_IDLE,      // Started, waiting for a job
    RESERVED,       // Taken by an executor, not yet running code
    EXECUTING,      // Running exactly one session's payload
    RETIRED         // Stopped and removed; never handed out again
};

std::string pool_state_to_string(PoolState state);

struct SandboxInfo {
    SandboxHandle handle;
    PoolState state = PoolState::WARM_IDLE;
    std::string session_id;                        // Set while EXECUTING
    Clock::time_point created_at;
    Clock::time_point state_changed_at;
};

// Keeps up to target_size started sandboxes ready so a submission does not
// pay container start latency. Sandboxes are single-use: release() retires
// and destroys them, and a new one is created to fill the slot.
class PrewarmPool {
public:
    struct Config {
        size_t target_size;
        ResourceLimits limits;
        std::chrono::milliseconds replenish_interval;

        Config() :
            target_size(DEFAULT_POOL_SIZE),
            replenish_interval(REPLENISH_INTERVAL_MS) {}
    };

    struct Stats {
        size_t target_size = 0;
        size_t idle = 0;
        size_t reserved = 0;
        size_t executing = 0;
        size_t creating = 0;
        size_t created_total = 0;
        size_t retired_total = 0;
    };

    PrewarmPool(SandboxRuntime& runtime, const Config& config = Config(),
                Clock& clock = SteadyClock::instance());
    ~PrewarmPool();

    PrewarmPool(const PrewarmPool&) = delete;
    PrewarmPool& operator=(const PrewarmPool&) = delete;

    // Take one idle sandbox (now RESERVED), or nothing if the pool is empty
    std::optional<SandboxHandle> acquire();

    // Track a sandbox the executor created on demand, as RESERVED
    void adopt(const SandboxHandle& handle);

    // RESERVED -> EXECUTING for one session; false if it was retired meanwhile
    bool mark_executing(const std::string& sandbox_id, const std::string& session_id);

    // Retire and destroy a sandbox. Safe to call more than once.
    void release(const std::string& sandbox_id);

    // One fill pass up to target size; returns how many sandboxes were added
    size_t replenish();

    // Wake the background replenisher
    void trigger_replenish();

    // Force-retire sandboxes stuck in RESERVED/EXECUTING longer than hard_timeout
    std::vector<std::string> retire_stale(std::chrono::milliseconds hard_timeout);

    // Retire every idle sandbox (process shutdown)
    void shutdown();

    void start();
    void stop();

    std::optional<SandboxInfo> info(const std::string& sandbox_id) const;
    Stats stats() const;

private:
    void replenish_loop();
    void destroy(const SandboxHandle& handle);

    // Move a live record into the retired history; caller holds mutex_
    SandboxHandle retire_locked(std::map<std::string, SandboxInfo>::iterator it);

    SandboxRuntime& runtime_;
    Config config_;
    Clock& clock_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::string> idle_;
    std::map<std::string, SandboxInfo> sandboxes_;
    std::map<std::string, SandboxInfo> retired_;   // Recent history, bounded
    std::deque<std::string> retired_order_;
    size_t creating_ = 0;
    bool trigger_pending_ = false;
    size_t created_total_ = 0;
    size_t retired_total_ = 0;

    std::atomic<bool> running_{false};
    std::thread replenisher_;
};

} // namespace sandpool
