#pragma once

#include <stdexcept>
#include <string>

namespace sandpool {

enum class ErrorCode {
    ENGINE_UNAVAILABLE,     // Container engine unreachable or failing
    RESOURCE_EXHAUSTED,     // Host limits hit while creating a sandbox
    SANDBOX_CRASHED,        // Process inside the sandbox died abnormally
    TIMEOUT,                // Execution exceeded its wall-clock bound
    SESSION_NOT_FOUND,
    INVALID_PAYLOAD         // Upload rejected before a session exists
};

std::string error_code_to_string(ErrorCode code);

// Base for every error the lifecycle core raises
class PoolError : public std::runtime_error {
public:
    PoolError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

    // Engine-level failures worth retrying during sandbox acquisition
    bool is_transient() const {
        return code_ == ErrorCode::ENGINE_UNAVAILABLE ||
               code_ == ErrorCode::RESOURCE_EXHAUSTED;
    }

private:
    ErrorCode code_;
};

class EngineUnavailableError : public PoolError {
public:
    explicit EngineUnavailableError(const std::string& message)
        : PoolError(ErrorCode::ENGINE_UNAVAILABLE, "Engine unavailable: " + message) {}
};

class ResourceExhaustedError : public PoolError {
public:
    explicit ResourceExhaustedError(const std::string& message)
        : PoolError(ErrorCode::RESOURCE_EXHAUSTED, "Resource exhausted: " + message) {}
};

class SandboxCrashedError : public PoolError {
public:
    explicit SandboxCrashedError(const std::string& message)
        : PoolError(ErrorCode::SANDBOX_CRASHED, "Sandbox crashed: " + message) {}
};

class TimeoutError : public PoolError {
public:
    explicit TimeoutError(const std::string& message)
        : PoolError(ErrorCode::TIMEOUT, "Timeout: " + message) {}
};

class SessionNotFoundError : public PoolError {
public:
    explicit SessionNotFoundError(const std::string& session_id)
        : PoolError(ErrorCode::SESSION_NOT_FOUND, "Session not found: " + session_id) {}
};

class InvalidPayloadError : public PoolError {
public:
    explicit InvalidPayloadError(const std::string& message)
        : PoolError(ErrorCode::INVALID_PAYLOAD, message) {}
};

} // namespace sandpool
