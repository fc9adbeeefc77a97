// modules/delegation/load_balancer.h
#ifndef AGENTGRAPH_MODULES_DELEGATION_LOAD_BALANCER_H
#define AGENTGRAPH_MODULES_DELEGATION_LOAD_BALANCER_H

#include "core/types/task.h"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

namespace agentgraph {

// Picks a worker for a task. Safe to call from several threads.
class LoadBalancer {
public:
    LoadBalancer();
    explicit LoadBalancer(uint64_t seed); // deterministic RANDOM strategy

    // Returns a pointer into workers; nullptr only when workers is empty.
    const AgentInfo* select_worker(const std::vector<AgentInfo>& workers,
                                   const WorkerTask& task,
                                   LoadBalancingStrategy strategy);

private:
    const AgentInfo* select_round_robin(const std::vector<AgentInfo>& workers);
    const AgentInfo* select_random(const std::vector<AgentInfo>& workers);
    static const AgentInfo* select_capability_based(const std::vector<AgentInfo>& workers, const WorkerTask& task);
    static const AgentInfo* select_priority_based(const std::vector<const AgentInfo*>& candidates);

    std::atomic<uint64_t> round_robin_cursor_{0};
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_DELEGATION_LOAD_BALANCER_H
