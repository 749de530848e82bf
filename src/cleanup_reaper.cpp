#include "cleanup_reaper.h"
#include "errors.h"

#include <iostream>

namespace sandpool {

CleanupReaper::CleanupReaper(SessionTable& sessions, PrewarmPool& pool,
                             const Config& config, Clock& clock)
    : sessions_(sessions), pool_(pool), config_(config), clock_(clock) {}

CleanupReaper::~CleanupReaper() {
    stop();
}

void CleanupReaper::cleanup(const std::string& session_id) {
    Session before = sessions_.mark_cleaned(session_id);
    if (before.state == SessionState::CLEANED_UP) return;

    if (!before.sandbox_id.empty()) {
        auto info = pool_.info(before.sandbox_id);
        if (info && info->state != PoolState::RETIRED) {
            // Still bound to this session: force stop and remove it now
            pool_.release(before.sandbox_id);
        }
    }

    std::cout << "[Reaper] Cleaned up session " << session_id << " (was "
              << session_state_to_string(before.state) << ")" << std::endl;
}

CleanupReaper::ReapStats CleanupReaper::reap_once() {
    ReapStats stats;
    auto now = clock_.now();

    for (const auto& session : sessions_.snapshot()) {
        if (is_finished(session.state) && now - session.last_accessed_at > config_.retention) {
            try {
                Session before = sessions_.mark_cleaned(session.id);
                if (is_finished(before.state)) stats.sessions_cleaned++;
            } catch (const SessionNotFoundError&) {
                // Purged by an overlapping pass
            }
        } else if (session.state == SessionState::CLEANED_UP && session.cleaned_at &&
                   now - *session.cleaned_at > config_.purge_after) {
            if (sessions_.purge(session.id)) stats.sessions_purged++;
        }
    }

    stats.sandboxes_retired = pool_.retire_stale(config_.sandbox_hard_timeout).size();

    if (stats.sessions_cleaned || stats.sessions_purged || stats.sandboxes_retired) {
        std::cout << "[Reaper] Cleaned " << stats.sessions_cleaned << " session(s), purged "
                  << stats.sessions_purged << " record(s), retired "
                  << stats.sandboxes_retired << " stuck sandbox(es)" << std::endl;
    }
    return stats;
}

void CleanupReaper::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this]() { reap_loop(); });
}

void CleanupReaper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) return;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void CleanupReaper::reap_loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait_for(lock, config_.interval, [this] { return !running_; });
        }
        if (!running_) break;

        try {
            reap_once();
        } catch (const std::exception& e) {
            std::cerr << "[Reaper] Scan failed: " << e.what() << std::endl;
        }
    }
}

} // namespace sandpool
