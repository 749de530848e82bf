#include "config.h"

#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace sandpool {

namespace {

long long parse_integer(const std::string& flag, const std::string& value,
                        long long min, long long max) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (parsed < min || parsed > max) {
        throw std::invalid_argument(flag + " must be between " + std::to_string(min) +
                                    " and " + std::to_string(max));
    }
    return parsed;
}

} // namespace

size_t Config::parse_memory(const std::string& value) {
    if (value.empty()) {
        throw std::invalid_argument("--memory expects a size, e.g. 128m");
    }

    std::string digits = value;
    size_t multiplier = 1;
    switch (std::tolower(static_cast<unsigned char>(value.back()))) {
        case 'k': multiplier = 1024; break;
        case 'm': multiplier = 1024 * 1024; break;
        case 'g': multiplier = 1024 * 1024 * 1024; break;
        case 'b': multiplier = 1; break;
        default: digits.push_back('b'); break;
    }
    digits.pop_back();

    // Docker refuses anything below 6MB
    long long amount = parse_integer("--memory", digits, 1, std::numeric_limits<int>::max());
    size_t bytes = static_cast<size_t>(amount) * multiplier;
    if (bytes < 6 * 1024 * 1024) {
        throw std::invalid_argument("--memory must be at least 6m");
    }
    return bytes;
}

Config Config::from_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string flag = argv[i];

        if (flag == "--help" || flag == "-h") {
            config.show_help = true;
            continue;
        }

        if (flag.rfind("--", 0) != 0) {
            throw std::invalid_argument("Unexpected argument: " + flag);
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + " requires a value");
        }
        std::string value = argv[++i];

        if (flag == "--port") {
            config.port = static_cast<int>(parse_integer(flag, value, 0, 65535));
        } else if (flag == "--image") {
            if (value.empty()) throw std::invalid_argument("--image must not be empty");
            config.docker.image = value;
        } else if (flag == "--docker") {
            if (value.empty()) throw std::invalid_argument("--docker must not be empty");
            config.docker.binary = value;
        } else if (flag == "--pool-size") {
            config.pool.target_size = static_cast<size_t>(parse_integer(flag, value, 0, 256));
        } else if (flag == "--workers") {
            config.executor.workers = static_cast<size_t>(parse_integer(flag, value, 1, 256));
        } else if (flag == "--timeout") {
            config.executor.default_timeout = std::chrono::seconds(parse_integer(flag, value, 1, 3600));
        } else if (flag == "--memory") {
            config.limits.memory_limit_bytes = parse_memory(value);
        } else if (flag == "--cpu-quota") {
            config.limits.cpu_quota_us = static_cast<long>(parse_integer(flag, value, 1000, 100000000));
        } else if (flag == "--cpu-period") {
            config.limits.cpu_period_us = static_cast<long>(parse_integer(flag, value, 1000, 1000000));
        } else if (flag == "--retention") {
            config.reaper.retention = std::chrono::seconds(parse_integer(flag, value, 1, 86400));
        } else if (flag == "--purge-after") {
            config.reaper.purge_after = std::chrono::seconds(parse_integer(flag, value, 0, 86400));
        } else if (flag == "--reap-interval") {
            config.reaper.interval = std::chrono::seconds(parse_integer(flag, value, 1, 3600));
        } else if (flag == "--retry-attempts") {
            config.executor.retry.max_attempts = static_cast<int>(parse_integer(flag, value, 1, 20));
        } else {
            throw std::invalid_argument("Unknown option: " + flag);
        }
    }

    config.finalize();
    return config;
}

void Config::finalize() {
    pool.limits = limits;
    executor.limits = limits;

    // A sandbox held longer than this belongs to a dead executor
    reaper.sandbox_hard_timeout = executor.default_timeout +
        std::chrono::seconds(SANDBOX_HARD_TIMEOUT_GRACE_SECONDS);
}

std::string Config::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --port N            HTTP port (default " << DEFAULT_PORT << ")\n"
        << "  --image NAME        Container image (default " << DEFAULT_IMAGE << ")\n"
        << "  --docker PATH       Container engine CLI (default " << DEFAULT_DOCKER_BINARY << ")\n"
        << "  --pool-size N       Pre-warmed sandboxes to keep (default " << DEFAULT_POOL_SIZE << ")\n"
        << "  --workers N         Concurrent executions (default " << DEFAULT_WORKERS << ")\n"
        << "  --timeout SECS      Execution time limit (default " << DEFAULT_TIMEOUT_SECONDS << ")\n"
        << "  --memory SIZE       Sandbox memory limit, e.g. 128m\n"
        << "  --cpu-quota US      CFS quota per period (default " << DEFAULT_CPU_QUOTA_US << ")\n"
        << "  --cpu-period US     CFS period (default " << DEFAULT_CPU_PERIOD_US << ")\n"
        << "  --retention SECS    Keep unpolled results this long (default "
        << DEFAULT_RETENTION_SECONDS << ")\n"
        << "  --purge-after SECS  Forget cleaned-up sessions after (default "
        << DEFAULT_PURGE_AFTER_SECONDS << ")\n"
        << "  --reap-interval SECS  Cleanup scan period (default "
        << DEFAULT_REAP_INTERVAL_SECONDS << ")\n"
        << "  --retry-attempts N  Sandbox creation attempts (default "
        << DEFAULT_RETRY_ATTEMPTS << ")\n"
        << "  --help              Show this message\n";
    return out.str();
}

} // namespace sandpool
