#include "errors.h"

namespace sandpool {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ENGINE_UNAVAILABLE: return "EngineUnavailable";
        case ErrorCode::RESOURCE_EXHAUSTED: return "ResourceExhausted";
        case ErrorCode::SANDBOX_CRASHED: return "SandboxCrashed";
        case ErrorCode::TIMEOUT: return "Timeout";
        case ErrorCode::SESSION_NOT_FOUND: return "SessionNotFound";
        case ErrorCode::INVALID_PAYLOAD: return "InvalidPayload";
    }
    return "Unknown";
}

} // namespace sandpool
