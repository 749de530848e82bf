#pragma once

#include <cstddef>  // for size_t

namespace sandpool {

// Sandbox resource limits
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 128 * 1024 * 1024;  // 128MB
constexpr long DEFAULT_CPU_QUOTA_US = 50000;                       // Half a core...
constexpr long DEFAULT_CPU_PERIOD_US = 100000;                     // ...per 100ms period
constexpr int DEFAULT_PIDS_LIMIT = 64;                             // Max processes per sandbox
constexpr const char* DEFAULT_IMAGE = "python:3.13-slim";
constexpr const char* DEFAULT_DOCKER_BINARY = "docker";
constexpr const char* SANDBOX_LABEL = "sandpool.managed=1";
constexpr const char* SANDBOX_CODE_DIR = "/code";

// Payload limits
constexpr size_t MAX_SCRIPT_SIZE = 1024 * 1024;                    // 1MB script
constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;               // 10MB captured output
constexpr size_t MAX_REQUEST_SIZE = 16 * 1024 * 1024;              // 16MB max request

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 10;                        // Wall clock per execution
constexpr int DEFAULT_RETENTION_SECONDS = 60;                      // Finished sessions idle this long are reaped
constexpr int DEFAULT_PURGE_AFTER_SECONDS = 300;                   // Cleaned-up records kept this long
constexpr int DEFAULT_REAP_INTERVAL_SECONDS = 5;
constexpr int SANDBOX_HARD_TIMEOUT_GRACE_SECONDS = 30;             // Added to the execution timeout
constexpr int ENGINE_COMMAND_TIMEOUT_SECONDS = 60;                 // create/start/stop/rm
constexpr int REPLENISH_INTERVAL_MS = 1000;
constexpr size_t RETIRED_HISTORY = 256;                             // Retired/removed ids remembered for idempotence

// Pool and workers
constexpr size_t DEFAULT_POOL_SIZE = 1;
constexpr size_t DEFAULT_WORKERS = 4;

// Engine retry policy
constexpr int DEFAULT_RETRY_ATTEMPTS = 3;
constexpr int DEFAULT_RETRY_BACKOFF_MS = 200;
constexpr int MAX_RETRY_BACKOFF_MS = 5000;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                          // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                       // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 5000;                                 // Default server port
constexpr int LISTEN_BACKLOG = 64;                                 // Socket listen backlog
constexpr int SHUTDOWN_DRAIN_SECONDS = 10;                         // Wait for in-flight requests on exit

} // namespace sandpool
