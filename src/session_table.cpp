#include "session_table.h"
#include "constants.h"
#include "crypto_utils.h"
#include "errors.h"

#include <stdexcept>

namespace sandpool {

std::string session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::PENDING: return "PENDING";
        case SessionState::RUNNING: return "RUNNING";
        case SessionState::COMPLETED: return "COMPLETED";
        case SessionState::FAILED: return "FAILED";
        case SessionState::CLEANED_UP: return "CLEANED_UP";
    }
    return "UNKNOWN";
}

SessionTable::SessionTable(Clock& clock) : clock_(clock) {}

std::string SessionTable::create(const std::string& payload_sha256) {
    auto entry = std::make_shared<Entry>();
    entry->session.payload_sha256 = payload_sha256;
    entry->session.created_at = clock_.now();
    entry->session.last_accessed_at = entry->session.created_at;

    std::unique_lock lock(mutex_);
    std::string id;
    do {
        id = CryptoUtils::random_uuid();
    } while (entries_.count(id));

    entry->session.id = id;
    entries_[id] = entry;
    return id;
}

bool SessionTable::set_running(const std::string& id, const std::string& sandbox_id) {
    auto entry = find(id);
    if (!entry) return false;

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->session.state != SessionState::PENDING) return false;

    entry->session.state = SessionState::RUNNING;
    entry->session.sandbox_id = sandbox_id;
    return true;
}

bool SessionTable::append_output(const std::string& id, const std::string& chunk) {
    auto entry = find(id);
    if (!entry) return false;

    std::lock_guard<std::mutex> lock(entry->mutex);
    Session& session = entry->session;
    if (session.state != SessionState::RUNNING) return false;

    size_t room = MAX_OUTPUT_SIZE > session.output.size() ? MAX_OUTPUT_SIZE - session.output.size() : 0;
    if (chunk.size() > room) {
        session.output.append(chunk, 0, room);
        session.output_truncated = true;
    } else {
        session.output += chunk;
    }
    return true;
}

bool SessionTable::complete(const std::string& id, SessionState final_state,
                            const std::string& reason, int exit_code,
                            const std::string& error) {
    if (!is_finished(final_state)) {
        throw std::invalid_argument("complete() requires COMPLETED or FAILED, got " +
                                    session_state_to_string(final_state));
    }

    auto entry = find(id);
    if (!entry) return false;

    std::lock_guard<std::mutex> lock(entry->mutex);
    Session& session = entry->session;

    bool allowed = session.state == SessionState::RUNNING ||
                   (session.state == SessionState::PENDING && final_state == SessionState::FAILED);
    if (!allowed) return false;

    if (!reason.empty()) {
        if (!session.output.empty() && session.output.back() != '\n') {
            session.output += '\n';
        }
        session.output += "[sandpool] " + reason + "\n";
    }
    session.state = final_state;
    session.exit_code = exit_code;
    session.error = error;
    session.finished_at = clock_.now();
    return true;
}

Session SessionTable::get(const std::string& id) {
    auto entry = find(id);
    if (!entry) throw SessionNotFoundError(id);

    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->session.last_accessed_at = clock_.now();
    return entry->session;
}

Session SessionTable::mark_cleaned(const std::string& id) {
    auto entry = find(id);
    if (!entry) throw SessionNotFoundError(id);

    std::lock_guard<std::mutex> lock(entry->mutex);
    Session before = entry->session;
    if (before.state != SessionState::CLEANED_UP) {
        entry->session.state = SessionState::CLEANED_UP;
        entry->session.cleaned_at = clock_.now();
    }
    return before;
}

std::vector<Session> SessionTable::snapshot() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock lock(mutex_);
        entries.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            entries.push_back(entry);
        }
    }

    std::vector<Session> sessions;
    sessions.reserve(entries.size());
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        sessions.push_back(entry->session);
    }
    return sessions;
}

bool SessionTable::purge(const std::string& id) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;

    {
        std::lock_guard<std::mutex> entry_lock(it->second->mutex);
        if (it->second->session.state != SessionState::CLEANED_UP) return false;
    }
    entries_.erase(it);
    return true;
}

size_t SessionTable::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::shared_ptr<SessionTable::Entry> SessionTable::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;
    return it->second;
}

} // namespace sandpool
