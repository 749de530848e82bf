#pragma once

#include <chrono>
#include <string>
#include "constants.h"
#include "payload.h"
#include "process.h"

namespace sandpool {

// Limits applied when a sandbox is created; immutable afterwards
struct ResourceLimits {
    long cpu_quota_us = DEFAULT_CPU_QUOTA_US;
    long cpu_period_us = DEFAULT_CPU_PERIOD_US;
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    int pids_limit = DEFAULT_PIDS_LIMIT;
    bool network_disabled = true;                      // Airgapped by default
};

// Engine-assigned identity of one sandbox
struct SandboxHandle {
    std::string id;
    ResourceLimits limits;
};

struct ExecResult {
    int exit_code = 0;
    std::chrono::milliseconds wall_time{0};
};

// Capability interface over the container engine.
//
// create/start throw EngineUnavailableError or ResourceExhaustedError.
// exec streams output chunks to the sink and throws SandboxCrashedError or
// TimeoutError. stop/remove are no-ops on already stopped or removed
// sandboxes so cleanup races never turn into errors.
class SandboxRuntime {
public:
    virtual ~SandboxRuntime() = default;

    virtual SandboxHandle create(const ResourceLimits& limits) = 0;
    virtual void start(const SandboxHandle& handle) = 0;
    virtual ExecResult exec(const SandboxHandle& handle,
                            const Payload& payload,
                            std::chrono::milliseconds timeout,
                            const ChunkSink& sink) = 0;
    virtual void stop(const SandboxHandle& handle) = 0;
    virtual void remove(const SandboxHandle& handle) = 0;
};

} // namespace sandpool
