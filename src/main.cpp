/*
 * Sandpool - Pre-warmed sandboxes for untrusted Python scripts
 * Submit a script, poll for its output, clean up when done
 */

#include "api.h"
#include "cleanup_reaper.h"
#include "config.h"
#include "docker_runtime.h"
#include "errors.h"
#include "executor.h"
#include "http_server.h"
#include "prewarm_pool.h"
#include "session_table.h"
#include <csignal>
#include <iostream>
#include <stdexcept>

using namespace sandpool;

namespace {

HttpServer* active_server = nullptr;

void handle_signal(int) {
    if (active_server) {
        active_server->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::from_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << Config::usage(argv[0]);
        return 2;
    }

    if (config.show_help) {
        std::cout << Config::usage(argv[0]);
        return 0;
    }

    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "Sandpool - Sandboxed Script Execution" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Image:       " << config.docker.image << std::endl;
    std::cout << "Pool size:   " << config.pool.target_size << std::endl;
    std::cout << "Workers:     " << config.executor.workers << std::endl;
    std::cout << "Timeout:     "
              << std::chrono::duration_cast<std::chrono::seconds>(config.executor.default_timeout).count()
              << "s" << std::endl;
    std::cout << "Memory:      " << config.limits.memory_limit_bytes / (1024 * 1024) << "MB" << std::endl;
    std::cout << "CPU:         " << config.limits.cpu_quota_us << "/" << config.limits.cpu_period_us
              << "us" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    DockerRuntime runtime(config.docker);
    if (!runtime.is_available()) {
        // Keep serving: submissions fail with EngineUnavailable until the daemon is back
        std::cerr << "[Docker] Engine is not reachable via '" << config.docker.binary << "'" << std::endl;
    } else {
        try {
            runtime.remove_orphans();
        } catch (const PoolError& e) {
            std::cerr << "[Docker] Could not remove leftover sandboxes: " << e.what() << std::endl;
        }
    }

    SessionTable sessions;
    PrewarmPool pool(runtime, config.pool);
    Executor executor(sessions, pool, runtime, config.executor);
    CleanupReaper reaper(sessions, pool, config.reaper);

    HttpServer server(config.port);
    Api api(sessions, pool, executor, reaper);
    api.register_routes(server);

    pool.start();
    executor.start();
    reaper.start();

    active_server = &server;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int status = 0;
    try {
        // Blocks until a signal stops the server
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "[Server] " << e.what() << std::endl;
        status = 1;
    }
    active_server = nullptr;

    std::cout << "Shutting down..." << std::endl;
    if (!server.drain(std::chrono::seconds(SHUTDOWN_DRAIN_SECONDS))) {
        std::cerr << "[Server] " << server.active_connections()
                  << " request(s) still in flight after " << SHUTDOWN_DRAIN_SECONDS << "s" << std::endl;
    }
    reaper.stop();
    executor.stop();
    pool.stop();
    pool.shutdown();

    return status;
}
