#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "errors.h"
#include "sandbox_runtime.h"

namespace sandpool {

struct DockerConfig {
    std::string binary = DEFAULT_DOCKER_BINARY;       // docker CLI (or a compatible one)
    std::string image = DEFAULT_IMAGE;
    std::string interpreter = "python3";
    std::chrono::seconds command_timeout{ENGINE_COMMAND_TIMEOUT_SECONDS};
};

// SandboxRuntime backed by the docker CLI. Each sandbox is a container
// created with the configured limits and kept alive by `sleep infinity`
// until it is stopped and removed.
class DockerRuntime : public SandboxRuntime {
public:
    explicit DockerRuntime(const DockerConfig& config = DockerConfig{});
    ~DockerRuntime() override;

    SandboxHandle create(const ResourceLimits& limits) override;
    void start(const SandboxHandle& handle) override;
    ExecResult exec(const SandboxHandle& handle,
                    const Payload& payload,
                    std::chrono::milliseconds timeout,
                    const ChunkSink& sink) override;
    void stop(const SandboxHandle& handle) override;
    void remove(const SandboxHandle& handle) override;

    // True if the engine daemon answers
    bool is_available();

    // Removed ids remembered to short-circuit repeat stop/remove (bounded)
    size_t tracked_removals() const;

    // Remove containers left behind by a previous run; returns how many
    size_t remove_orphans();

    // Arguments for `docker create` with the given limits
    static std::vector<std::string> create_args(const DockerConfig& config,
                                                const ResourceLimits& limits);

    // Map a failed engine command onto EngineUnavailable/ResourceExhausted
    static ErrorCode classify_failure(const ProcessResult& result);

    // Map a local pipe/fork failure (EAGAIN, EMFILE, ENOMEM...) the same way
    static ErrorCode classify_launch_error(const std::string& message);

    // Container id from `docker create` output (last non-empty line)
    static std::string parse_container_id(const std::string& output);

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace sandpool
