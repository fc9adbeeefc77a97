// modules/delegation/worker_pool.cpp
#include "modules/delegation/worker_pool.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <mutex>

namespace agentgraph {

bool WorkerPool::add_worker(const WorkerId& worker_id, AgentCapabilities capabilities) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (workers_.count(worker_id)) {
        return false;
    }
    auto entry = std::make_unique<Entry>();
    entry->capabilities = std::move(capabilities);
    workers_.emplace(worker_id, std::move(entry));
    order_.push_back(worker_id);
    logger()->debug("Worker '{}' registered", worker_id);
    return true;
}

bool WorkerPool::remove_worker(const WorkerId& worker_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (workers_.erase(worker_id) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), worker_id), order_.end());
    logger()->debug("Worker '{}' removed", worker_id);
    return true;
}

AgentInfo WorkerPool::to_info(const WorkerId& worker_id, const Entry& entry) const {
    AgentInfo info;
    info.worker_id = worker_id;
    info.capabilities = entry.capabilities;
    info.current_task_count = entry.load.load(std::memory_order_acquire);
    return info;
}

std::vector<AgentInfo> WorkerPool::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<AgentInfo> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(to_info(id, *workers_.at(id)));
    }
    return out;
}

std::optional<AgentInfo> WorkerPool::find(const WorkerId& worker_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) {
        return std::nullopt;
    }
    return to_info(worker_id, *it->second);
}

bool WorkerPool::increment_load(const WorkerId& worker_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) {
        return false;
    }
    it->second->load.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

bool WorkerPool::decrement_load(const WorkerId& worker_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) {
        return false;
    }
    auto& load = it->second->load;
    int current = load.load(std::memory_order_acquire);
    while (current > 0 && !load.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel)) {
    }
    return true;
}

std::size_t WorkerPool::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return workers_.size();
}

std::size_t WorkerPool::available_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(order_.begin(), order_.end(), [this](const WorkerId& id) {
        const Entry& entry = *workers_.at(id);
        return entry.load.load(std::memory_order_acquire) < entry.capabilities.max_concurrent_tasks;
    }));
}

} // namespace agentgraph
