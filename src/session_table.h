#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "clock.h"

namespace sandpool {

enum class SessionState {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    CLEANED_UP
};

std::string session_state_to_string(SessionState state);

// COMPLETED or FAILED: execution is over, record not yet reclaimed
inline bool is_finished(SessionState state) {
    return state == SessionState::COMPLETED || state == SessionState::FAILED;
}

// One tracked execution request. Output holds stdout and stderr
// interleaved in arrival order; it only ever grows.
struct Session {
    std::string id;
    SessionState state = SessionState::PENDING;
    std::string sandbox_id;                  // Empty while PENDING
    std::string output;
    bool output_truncated = false;           // Hit MAX_OUTPUT_SIZE
    int exit_code = 0;
    std::string error;                       // Error kind that failed the session
    std::string payload_sha256;
    Clock::time_point created_at;
    Clock::time_point last_accessed_at;
    std::optional<Clock::time_point> finished_at;
    std::optional<Clock::time_point> cleaned_at;
};

// Authoritative map of session id -> Session. The map itself is guarded by
// a reader/writer lock; each entry has its own mutex, so operations on one
// session are linearized without contending with other sessions.
//
// Mutators return false instead of throwing when the transition is not
// allowed (already terminal, wrong state, unknown id); the first writer
// to reach a terminal state wins.
class SessionTable {
public:
    explicit SessionTable(Clock& clock = SteadyClock::instance());

    // New PENDING session; returns its id
    std::string create(const std::string& payload_sha256 = "");

    // PENDING -> RUNNING, binding the sandbox
    bool set_running(const std::string& id, const std::string& sandbox_id);

    // Append a chunk while RUNNING
    bool append_output(const std::string& id, const std::string& chunk);

    // RUNNING -> COMPLETED/FAILED (or PENDING -> FAILED when no sandbox could
    // be acquired). A non-empty reason is appended to the output.
    bool complete(const std::string& id, SessionState final_state,
                  const std::string& reason = "", int exit_code = 0,
                  const std::string& error = "");

    // Copy of the session; refreshes last_accessed_at.
    // Throws SessionNotFoundError for unknown ids.
    Session get(const std::string& id);

    // Any non-terminal state -> CLEANED_UP. Returns the session as it was
    // before the transition. Throws SessionNotFoundError for unknown ids;
    // a no-op on sessions already CLEANED_UP.
    Session mark_cleaned(const std::string& id);

    // Copies of every session, without touching access times
    std::vector<Session> snapshot() const;

    // Erase a CLEANED_UP record; false for any other state
    bool purge(const std::string& id);

    size_t size() const;

private:
    struct Entry {
        std::mutex mutex;
        Session session;
    };

    std::shared_ptr<Entry> find(const std::string& id) const;

    Clock& clock_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace sandpool
