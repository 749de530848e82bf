#include "executor.h"
#include "errors.h"

#include <algorithm>
#include <iostream>

namespace sandpool {

namespace {

// Returns the sandbox to the pool (which retires it) when the job is done,
// however it ends
class SandboxLease {
public:
    SandboxLease(PrewarmPool& pool, const std::string& sandbox_id)
        : pool_(pool), sandbox_id_(sandbox_id) {}

    ~SandboxLease() {
        pool_.release(sandbox_id_);
    }

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

private:
    PrewarmPool& pool_;
    std::string sandbox_id_;
};

} // namespace

std::chrono::milliseconds RetryPolicy::backoff_after(int attempt) const {
    double delay = static_cast<double>(initial_backoff.count());
    for (int i = 1; i < attempt; ++i) {
        delay *= multiplier;
        if (delay >= max_backoff.count()) break;
    }
    auto ms = static_cast<long long>(std::min(delay, static_cast<double>(max_backoff.count())));
    return std::chrono::milliseconds(ms);
}

Executor::Executor(SessionTable& sessions, PrewarmPool& pool, SandboxRuntime& runtime,
                   const Config& config, Clock& clock)
    : sessions_(sessions), pool_(pool), runtime_(runtime), config_(config), clock_(clock) {}

Executor::~Executor() {
    stop();
}

std::string Executor::submit(const Payload& payload) {
    return submit(payload, config_.default_timeout);
}

std::string Executor::submit(const Payload& payload, std::chrono::milliseconds timeout) {
    std::string session_id = sessions_.create(payload.sha256());

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        Job job;
        job.session_id = session_id;
        job.payload = payload;
        job.timeout = timeout;
        queue_.push_back(std::move(job));
    }
    queue_cv_.notify_one();

    std::cout << "[Executor] Session submitted: " << session_id
              << " (" << payload.filename << ", " << payload.content.size() << " bytes)" << std::endl;
    return session_id;
}

void Executor::run(const std::string& session_id, const Payload& payload,
                   std::chrono::milliseconds timeout) {
    SandboxHandle handle;
    try {
        handle = acquire_sandbox(session_id);
    } catch (const PoolError& e) {
        std::cerr << "[Executor] Could not acquire sandbox for " << session_id
                  << ": " << e.what() << std::endl;
        sessions_.complete(session_id, SessionState::FAILED, e.what(), -1,
                           error_code_to_string(e.code()));
        return;
    } catch (const std::exception& e) {
        std::cerr << "[Executor] Could not acquire sandbox for " << session_id
                  << ": " << e.what() << std::endl;
        sessions_.complete(session_id, SessionState::FAILED, e.what(), -1,
                           error_code_to_string(ErrorCode::ENGINE_UNAVAILABLE));
        return;
    }

    SandboxLease lease(pool_, handle.id);

    if (!sessions_.set_running(session_id, handle.id)) {
        std::cout << "[Executor] Session " << session_id
                  << " was cleaned up before it started" << std::endl;
        return;
    }
    if (!pool_.mark_executing(handle.id, session_id)) {
        sessions_.complete(session_id, SessionState::FAILED,
                           "sandbox was retired before execution started", -1,
                           error_code_to_string(ErrorCode::SANDBOX_CRASHED));
        return;
    }

    std::cout << "[Executor] Executing " << session_id << " in sandbox " << handle.id << std::endl;

    try {
        ExecResult result = runtime_.exec(handle, payload, timeout,
            [this, &session_id](const std::string& chunk) {
                sessions_.append_output(session_id, chunk);
            });

        if (sessions_.complete(session_id, SessionState::COMPLETED, "", result.exit_code)) {
            std::cout << "[Executor] Session " << session_id << " completed (exit="
                      << result.exit_code << ", wall=" << result.wall_time.count() << "ms)" << std::endl;
        }
    } catch (const PoolError& e) {
        // Execution failures are final; untrusted code is never re-run automatically
        if (sessions_.complete(session_id, SessionState::FAILED, e.what(), -1,
                               error_code_to_string(e.code()))) {
            std::cout << "[Executor] Session " << session_id << " failed: " << e.what() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Executor] Session " << session_id << " hit an internal error: "
                  << e.what() << std::endl;
        sessions_.complete(session_id, SessionState::FAILED,
                           std::string("internal error: ") + e.what(), -1,
                           error_code_to_string(ErrorCode::SANDBOX_CRASHED));
    }
}

SandboxHandle Executor::acquire_sandbox(const std::string& session_id) {
    if (auto warm = pool_.acquire()) {
        return *warm;
    }

    for (int attempt = 1;; ++attempt) {
        try {
            SandboxHandle handle = runtime_.create(config_.limits);
            try {
                runtime_.start(handle);
            } catch (...) {
                discard(handle);
                throw;
            }
            pool_.adopt(handle);
            return handle;
        } catch (const PoolError& e) {
            if (!e.is_transient() || attempt >= config_.retry.max_attempts) {
                throw;
            }

            auto delay = config_.retry.backoff_after(attempt);
            std::cerr << "[Executor] Attempt " << attempt << "/" << config_.retry.max_attempts
                      << " to create a sandbox for " << session_id << " failed: " << e.what()
                      << " (retrying in " << delay.count() << "ms)" << std::endl;
            clock_.sleep_for(delay);
        }

        // The replenisher may have filled the pool while we waited
        if (auto warm = pool_.acquire()) {
            return *warm;
        }
    }
}

void Executor::discard(const SandboxHandle& handle) {
    try {
        runtime_.remove(handle);
    } catch (const std::exception& e) {
        std::cerr << "[Executor] Failed to remove sandbox " << handle.id << ": " << e.what() << std::endl;
    }
}

void Executor::start() {
    if (running_.exchange(true)) return;

    size_t count = std::max<size_t>(1, config_.workers);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    std::cout << "[Executor] Started " << count << " worker(s)" << std::endl;
}

void Executor::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();

    std::deque<Job> abandoned;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        abandoned.swap(queue_);
    }
    for (const auto& job : abandoned) {
        sessions_.complete(job.session_id, SessionState::FAILED, "service shutting down", -1,
                           error_code_to_string(ErrorCode::ENGINE_UNAVAILABLE));
    }
}

size_t Executor::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void Executor::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            if (!running_) return;

            job = std::move(queue_.front());
            queue_.pop_front();
        }
        run(job.session_id, job.payload, job.timeout);
    }
}

} // namespace sandpool
