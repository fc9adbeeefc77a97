// modules/delegation/worker_pool.h
#ifndef AGENTGRAPH_MODULES_DELEGATION_WORKER_POOL_H
#define AGENTGRAPH_MODULES_DELEGATION_WORKER_POOL_H

#include "core/types/task.h"
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace agentgraph {

// Registered workers with per-worker atomic load counters
class WorkerPool {
public:
    // False when the id is already registered
    bool add_worker(const WorkerId& worker_id, AgentCapabilities capabilities);
    bool remove_worker(const WorkerId& worker_id);

    // Registration order, which is the tie-break order of the load balancer
    std::vector<AgentInfo> snapshot() const;
    std::optional<AgentInfo> find(const WorkerId& worker_id) const;

    // Both return false for unknown workers. The counter never drops below zero.
    bool increment_load(const WorkerId& worker_id);
    bool decrement_load(const WorkerId& worker_id);

    std::size_t size() const;
    std::size_t available_count() const;

private:
    struct Entry {
        AgentCapabilities capabilities;
        std::atomic<int> load{0};
    };

    AgentInfo to_info(const WorkerId& worker_id, const Entry& entry) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<WorkerId, std::unique_ptr<Entry>> workers_;
    std::vector<WorkerId> order_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_DELEGATION_WORKER_POOL_H
