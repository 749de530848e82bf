#pragma once

#include <string>
#include "cleanup_reaper.h"
#include "docker_runtime.h"
#include "executor.h"
#include "prewarm_pool.h"

namespace sandpool {

// Process-wide settings. Defaults come from constants.h; from_args()
// overrides them from the command line.
struct Config {
    int port = DEFAULT_PORT;
    bool show_help = false;

    DockerConfig docker;
    ResourceLimits limits;
    PrewarmPool::Config pool;
    Executor::Config executor;
    CleanupReaper::Config reaper;

    // Throws std::invalid_argument on unknown flags, missing or bad values
    static Config from_args(int argc, char* argv[]);

    static std::string usage(const std::string& program);

    // Parse a docker-style size ("128m", "1g", "65536")
    static size_t parse_memory(const std::string& value);

private:
    // Copy shared settings (limits, timeout) into the component configs
    void finalize();
};

} // namespace sandpool
