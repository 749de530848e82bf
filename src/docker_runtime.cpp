#include "docker_runtime.h"

#include <algorithm>
#include <cctype>
#include <deque>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>

namespace sandpool {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (haystack.find(needle) != std::string::npos) return true;
    }
    return false;
}

const std::vector<std::string>& host_limit_markers() {
    static const std::vector<std::string> markers = {
        "no space left", "cannot allocate memory", "out of memory", "too many",
        "resource temporarily unavailable", "insufficient", "quota exceeded"};
    return markers;
}

bool container_gone(const ProcessResult& result) {
    std::string text = to_lower(result.output);
    return contains_any(text, {"no such container", "is not running", "is restarting",
                               "removal of container", "is already in progress"});
}

std::string first_line(const std::string& text) {
    size_t end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

bool is_hex_id(const std::string& value) {
    return value.size() >= 12 &&
           std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isxdigit(c); });
}

} // namespace

class DockerRuntime::Impl {
public:
    DockerConfig config_;
    std::mutex mutex_;
    std::set<std::string> stopped_;
    std::set<std::string> removed_;
    std::deque<std::string> removed_order_;

    explicit Impl(const DockerConfig& config) : config_(config) {}

    ProcessResult run_engine(std::vector<std::string> args,
                             const std::string& stdin_data = "",
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(0),
                             const ChunkSink& sink = nullptr) {
        args.insert(args.begin(), config_.binary);
        if (timeout.count() <= 0) {
            timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.command_timeout);
        }
        try {
            return Process::run(args, stdin_data, timeout, sink);
        } catch (const std::runtime_error& e) {
            // pipe/fork failed on this host; the engine was never reached
            std::string detail = "could not launch " + config_.binary + ": " + e.what();
            if (classify_launch_error(e.what()) == ErrorCode::RESOURCE_EXHAUSTED) {
                throw ResourceExhaustedError(detail);
            }
            throw EngineUnavailableError(detail);
        }
    }

    [[noreturn]] void throw_engine_error(const std::string& action, const ProcessResult& result) {
        std::string detail = action + ": " + first_line(result.output);
        if (result.timed_out) {
            detail = action + ": engine did not answer within " +
                     std::to_string(config_.command_timeout.count()) + "s";
        }
        if (classify_failure(result) == ErrorCode::RESOURCE_EXHAUSTED) {
            throw ResourceExhaustedError(detail);
        }
        throw EngineUnavailableError(detail);
    }

    bool is_terminal(const std::set<std::string>& states, const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return states.count(id) > 0 || removed_.count(id) > 0;
    }

    void record(std::set<std::string>& states, const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        states.insert(id);
    }
};

DockerRuntime::DockerRuntime(const DockerConfig& config)
    : impl(std::make_unique<Impl>(config)) {}

DockerRuntime::~DockerRuntime() = default;

std::vector<std::string> DockerRuntime::create_args(const DockerConfig& config,
                                                    const ResourceLimits& limits) {
    std::vector<std::string> args = {
        "create",
        "--label", SANDBOX_LABEL,
        "--cpu-quota", std::to_string(limits.cpu_quota_us),
        "--cpu-period", std::to_string(limits.cpu_period_us),
        "--memory", std::to_string(limits.memory_limit_bytes),
        "--memory-swap", std::to_string(limits.memory_limit_bytes),
        "--pids-limit", std::to_string(limits.pids_limit),
        "--workdir", SANDBOX_CODE_DIR,
    };
    if (limits.network_disabled) {
        args.push_back("--network");
        args.push_back("none");
    }
    args.push_back(config.image);
    args.push_back("sleep");
    args.push_back("infinity");
    return args;
}

ErrorCode DockerRuntime::classify_failure(const ProcessResult& result) {
    if (result.spawn_failed || result.timed_out) {
        return ErrorCode::ENGINE_UNAVAILABLE;
    }
    std::string text = to_lower(result.output);
    if (contains_any(text, host_limit_markers())) {
        return ErrorCode::RESOURCE_EXHAUSTED;
    }
    return ErrorCode::ENGINE_UNAVAILABLE;
}

ErrorCode DockerRuntime::classify_launch_error(const std::string& message) {
    if (contains_any(to_lower(message), host_limit_markers())) {
        return ErrorCode::RESOURCE_EXHAUSTED;
    }
    return ErrorCode::ENGINE_UNAVAILABLE;
}

std::string DockerRuntime::parse_container_id(const std::string& output) {
    std::istringstream stream(output);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        line.erase(std::remove_if(line.begin(), line.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   line.end());
        if (!line.empty()) last = line;
    }
    return is_hex_id(last) ? last : "";
}

SandboxHandle DockerRuntime::create(const ResourceLimits& limits) {
    ProcessResult result = impl->run_engine(create_args(impl->config_, limits));
    if (!result.exited_cleanly() || result.exit_code != 0) {
        impl->throw_engine_error("docker create", result);
    }

    SandboxHandle handle;
    handle.id = parse_container_id(result.output);
    handle.limits = limits;
    if (handle.id.empty()) {
        throw EngineUnavailableError("docker create returned no container id: " +
                                     first_line(result.output));
    }
    return handle;
}

void DockerRuntime::start(const SandboxHandle& handle) {
    ProcessResult result = impl->run_engine({"start", handle.id});
    if (!result.exited_cleanly() || result.exit_code != 0) {
        impl->throw_engine_error("docker start " + handle.id, result);
    }
}

ExecResult DockerRuntime::exec(const SandboxHandle& handle,
                               const Payload& payload,
                               std::chrono::milliseconds timeout,
                               const ChunkSink& sink) {
    auto started = std::chrono::steady_clock::now();
    std::string script_path = std::string(SANDBOX_CODE_DIR) + "/" + payload.filename;

    // Copy the script in through stdin; filename is validated, passed as $1 anyway
    ProcessResult upload = impl->run_engine(
        {"exec", "-i", handle.id, "sh", "-c",
         "mkdir -p " + std::string(SANDBOX_CODE_DIR) + " && cat > \"$1\"", "sh", script_path},
        payload.content, timeout);
    if (upload.timed_out) {
        throw TimeoutError("copying script into sandbox exceeded " +
                           std::to_string(timeout.count()) + " ms");
    }
    if (!upload.exited_cleanly() || upload.exit_code != 0) {
        throw SandboxCrashedError("could not copy script into sandbox " + handle.id + ": " +
                                  first_line(upload.output));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto remaining = timeout - elapsed;
    if (remaining.count() <= 0) {
        throw TimeoutError("execution exceeded " + std::to_string(timeout.count()) + " ms");
    }

    ProcessResult run = impl->run_engine(
        {"exec", handle.id, impl->config_.interpreter, "-u", script_path}, "", remaining, sink);

    ExecResult exec_result;
    exec_result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (run.timed_out) {
        throw TimeoutError("execution exceeded " + std::to_string(timeout.count()) + " ms");
    }
    if (run.spawn_failed) {
        throw SandboxCrashedError(run.output);
    }
    if (run.term_signal != 0) {
        throw SandboxCrashedError("exec client killed by signal " + std::to_string(run.term_signal));
    }
    // docker exec reports a signalled process as 128 + signal
    if (run.exit_code >= 128) {
        int sig = run.exit_code - 128;
        std::string reason = "process killed by signal " + std::to_string(sig);
        if (sig == 9) reason += " (memory limit or forced stop)";
        throw SandboxCrashedError(reason);
    }
    if (run.exit_code != 0 &&
        (run.output.rfind("Error response from daemon", 0) == 0 ||
         run.output.rfind("OCI runtime exec failed", 0) == 0 || container_gone(run))) {
        throw SandboxCrashedError(first_line(run.output));
    }

    exec_result.exit_code = run.exit_code;
    return exec_result;
}

void DockerRuntime::stop(const SandboxHandle& handle) {
    if (impl->is_terminal(impl->stopped_, handle.id)) return;

    ProcessResult result = impl->run_engine({"stop", "-t", "1", handle.id});
    if ((result.exited_cleanly() && result.exit_code == 0) || container_gone(result)) {
        impl->record(impl->stopped_, handle.id);
        return;
    }
    impl->throw_engine_error("docker stop " + handle.id, result);
}

void DockerRuntime::remove(const SandboxHandle& handle) {
    {
        std::lock_guard<std::mutex> lock(impl->mutex_);
        if (impl->removed_.count(handle.id)) return;
    }

    ProcessResult result = impl->run_engine({"rm", "-f", handle.id});
    if ((result.exited_cleanly() && result.exit_code == 0) || container_gone(result)) {
        std::lock_guard<std::mutex> lock(impl->mutex_);
        impl->stopped_.erase(handle.id);
        if (impl->removed_.insert(handle.id).second) {
            impl->removed_order_.push_back(handle.id);
            if (impl->removed_order_.size() > RETIRED_HISTORY) {
                // Older ids fall back on the engine's "No such container" answer
                impl->removed_.erase(impl->removed_order_.front());
                impl->removed_order_.pop_front();
            }
        }
        return;
    }
    impl->throw_engine_error("docker rm " + handle.id, result);
}

size_t DockerRuntime::tracked_removals() const {
    std::lock_guard<std::mutex> lock(impl->mutex_);
    return impl->removed_.size();
}

bool DockerRuntime::is_available() {
    ProcessResult result = impl->run_engine(
        {"version", "--format", "{{.Server.Version}}"}, "", std::chrono::milliseconds(10000));
    return result.exited_cleanly() && result.exit_code == 0;
}

size_t DockerRuntime::remove_orphans() {
    ProcessResult result = impl->run_engine(
        {"ps", "-aq", "--filter", std::string("label=") + SANDBOX_LABEL});
    if (!result.exited_cleanly() || result.exit_code != 0) {
        impl->throw_engine_error("docker ps", result);
    }

    size_t removed = 0;
    std::istringstream stream(result.output);
    std::string id;
    while (stream >> id) {
        if (!is_hex_id(id)) continue;
        SandboxHandle handle;
        handle.id = id;
        remove(handle);
        removed++;
    }
    if (removed > 0) {
        std::cout << "[Docker] Removed " << removed << " orphaned sandboxes" << std::endl;
    }
    return removed;
}

} // namespace sandpool
