#include "prewarm_pool.h"
#include "errors.h"

#include <algorithm>
#include <iostream>

namespace sandpool {

std::string pool_state_to_string(PoolState state) {
    switch (state) {
        case PoolState::WARM_IDLE: return "WARM_IDLE";
        case PoolState::RESERVED: return "RESERVED";
        case PoolState::EXECUTING: return "EXECUTING";
        case PoolState::RETIRED: return "RETIRED";
    }
    return "UNKNOWN";
}

PrewarmPool::PrewarmPool(SandboxRuntime& runtime, const Config& config, Clock& clock)
    : runtime_(runtime), config_(config), clock_(clock) {}

PrewarmPool::~PrewarmPool() {
    stop();
    shutdown();
}

std::optional<SandboxHandle> PrewarmPool::acquire() {
    std::optional<SandboxHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            std::string id = idle_.front();
            idle_.pop_front();

            auto& info = sandboxes_.at(id);
            info.state = PoolState::RESERVED;
            info.state_changed_at = clock_.now();
            handle = info.handle;
        }
    }
    // Either a slot just opened or the pool was already dry
    wake_.notify_all();
    return handle;
}

void PrewarmPool::adopt(const SandboxHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    SandboxInfo info;
    info.handle = handle;
    info.state = PoolState::RESERVED;
    info.created_at = clock_.now();
    info.state_changed_at = info.created_at;
    sandboxes_[handle.id] = info;
    created_total_++;
}

bool PrewarmPool::mark_executing(const std::string& sandbox_id, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(sandbox_id);
    if (it == sandboxes_.end() || it->second.state != PoolState::RESERVED) {
        return false;
    }
    it->second.state = PoolState::EXECUTING;
    it->second.session_id = session_id;
    it->second.state_changed_at = clock_.now();
    return true;
}

void PrewarmPool::release(const std::string& sandbox_id) {
    SandboxHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sandboxes_.find(sandbox_id);
        if (it == sandboxes_.end()) return;  // Already retired

        if (it->second.state == PoolState::WARM_IDLE) {
            idle_.erase(std::remove(idle_.begin(), idle_.end(), sandbox_id), idle_.end());
        }
        handle = retire_locked(it);
    }

    destroy(handle);
    wake_.notify_all();
}

size_t PrewarmPool::replenish() {
    size_t wanted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t have = idle_.size() + creating_;
        if (have >= config_.target_size) return 0;
        wanted = config_.target_size - have;
        creating_ += wanted;
    }

    size_t added = 0;
    for (size_t i = 0; i < wanted; ++i) {
        SandboxHandle handle;
        bool created = false;
        try {
            handle = runtime_.create(config_.limits);
            created = true;
            runtime_.start(handle);
        } catch (const std::exception& e) {
            std::cerr << "[Pool] Failed to prewarm sandbox: " << e.what() << std::endl;
            if (created) destroy(handle);

            std::lock_guard<std::mutex> lock(mutex_);
            creating_ -= (wanted - i);
            return added;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        creating_--;
        SandboxInfo info;
        info.handle = handle;
        info.state = PoolState::WARM_IDLE;
        info.created_at = clock_.now();
        info.state_changed_at = info.created_at;
        sandboxes_[handle.id] = info;
        idle_.push_back(handle.id);
        created_total_++;
        added++;
    }

    std::cout << "[Pool] Prewarmed " << added << " sandbox(es)" << std::endl;
    return added;
}

void PrewarmPool::trigger_replenish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        trigger_pending_ = true;
    }
    wake_.notify_all();
}

std::vector<std::string> PrewarmPool::retire_stale(std::chrono::milliseconds hard_timeout) {
    std::vector<SandboxHandle> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_.now();
        for (auto it = sandboxes_.begin(); it != sandboxes_.end();) {
            const auto& info = it->second;
            bool in_use = info.state == PoolState::RESERVED || info.state == PoolState::EXECUTING;
            if (in_use && now - info.state_changed_at > hard_timeout) {
                std::cout << "[Pool] Force-retiring sandbox " << it->first << " stuck in "
                          << pool_state_to_string(info.state) << std::endl;
                stale.push_back(retire_locked(it++));
            } else {
                ++it;
            }
        }
    }

    std::vector<std::string> ids;
    for (const auto& handle : stale) {
        destroy(handle);
        ids.push_back(handle.id);
    }
    return ids;
}

void PrewarmPool::shutdown() {
    std::vector<SandboxHandle> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!sandboxes_.empty()) {
            remaining.push_back(retire_locked(sandboxes_.begin()));
        }
        idle_.clear();
    }

    if (!remaining.empty()) {
        std::cout << "[Pool] Shutting down, retiring " << remaining.size() << " sandbox(es)" << std::endl;
    }
    for (const auto& handle : remaining) {
        destroy(handle);
    }
}

void PrewarmPool::start() {
    if (running_.exchange(true)) return;
    replenisher_ = std::thread([this]() { replenish_loop(); });
}

void PrewarmPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) return;
    }
    wake_.notify_all();
    if (replenisher_.joinable()) {
        replenisher_.join();
    }
}

std::optional<SandboxInfo> PrewarmPool::info(const std::string& sandbox_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(sandbox_id);
    if (it != sandboxes_.end()) return it->second;

    auto retired = retired_.find(sandbox_id);
    if (retired != retired_.end()) return retired->second;
    return std::nullopt;
}

PrewarmPool::Stats PrewarmPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.target_size = config_.target_size;
    stats.creating = creating_;
    stats.created_total = created_total_;
    stats.retired_total = retired_total_;
    for (const auto& [id, info] : sandboxes_) {
        switch (info.state) {
            case PoolState::WARM_IDLE: stats.idle++; break;
            case PoolState::RESERVED: stats.reserved++; break;
            case PoolState::EXECUTING: stats.executing++; break;
            case PoolState::RETIRED: break;
        }
    }
    return stats;
}

void PrewarmPool::replenish_loop() {
    while (running_) {
        replenish();

        std::unique_lock<std::mutex> lock(mutex_);
        if (idle_.size() + creating_ < config_.target_size) {
            // The last pass came up short; give the engine a full interval
            wake_.wait_for(lock, config_.replenish_interval,
                           [this] { return !running_ || trigger_pending_; });
        } else {
            wake_.wait_for(lock, config_.replenish_interval, [this] {
                return !running_ || trigger_pending_ ||
                       idle_.size() + creating_ < config_.target_size;
            });
        }
        trigger_pending_ = false;
    }
}

SandboxHandle PrewarmPool::retire_locked(std::map<std::string, SandboxInfo>::iterator it) {
    SandboxInfo info = it->second;
    sandboxes_.erase(it);

    info.state = PoolState::RETIRED;
    info.session_id.clear();
    info.state_changed_at = clock_.now();
    retired_[info.handle.id] = info;
    retired_order_.push_back(info.handle.id);
    if (retired_order_.size() > RETIRED_HISTORY) {
        retired_.erase(retired_order_.front());
        retired_order_.pop_front();
    }
    retired_total_++;
    return info.handle;
}

void PrewarmPool::destroy(const SandboxHandle& handle) {
    try {
        runtime_.stop(handle);
    } catch (const std::exception& e) {
        std::cerr << "[Pool] Failed to stop sandbox " << handle.id << ": " << e.what() << std::endl;
    }
    try {
        runtime_.remove(handle);
    } catch (const std::exception& e) {
        std::cerr << "[Pool] Failed to remove sandbox " << handle.id << ": " << e.what() << std::endl;
    }
}

} // namespace sandpool
