// modules/delegation/load_balancer.cpp
#include "modules/delegation/load_balancer.h"

namespace agentgraph {

namespace {

std::vector<const AgentInfo*> all_of(const std::vector<AgentInfo>& workers) {
    std::vector<const AgentInfo*> out;
    out.reserve(workers.size());
    for (const auto& worker : workers) {
        out.push_back(&worker);
    }
    return out;
}

} // namespace

LoadBalancer::LoadBalancer() : rng_(std::random_device{}()) {}

LoadBalancer::LoadBalancer(uint64_t seed) : rng_(seed) {}

const AgentInfo* LoadBalancer::select_worker(const std::vector<AgentInfo>& workers,
                                             const WorkerTask& task,
                                             LoadBalancingStrategy strategy) {
    if (workers.empty()) {
        return nullptr;
    }

    switch (strategy) {
        case LoadBalancingStrategy::ROUND_ROBIN:
            return select_round_robin(workers);
        case LoadBalancingStrategy::CAPABILITY_BASED:
            return select_capability_based(workers, task);
        case LoadBalancingStrategy::PRIORITY_BASED:
            return select_priority_based(all_of(workers));
        case LoadBalancingStrategy::RANDOM:
            return select_random(workers);
    }
    return select_round_robin(workers);
}

const AgentInfo* LoadBalancer::select_round_robin(const std::vector<AgentInfo>& workers) {
    // Each call claims its own slot, so N concurrent calls over N workers hit each worker once
    const uint64_t slot = round_robin_cursor_.fetch_add(1, std::memory_order_relaxed);
    return &workers[slot % workers.size()];
}

const AgentInfo* LoadBalancer::select_random(const std::vector<AgentInfo>& workers) {
    std::uniform_int_distribution<std::size_t> dist(0, workers.size() - 1);
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return &workers[dist(rng_)];
}

const AgentInfo* LoadBalancer::select_capability_based(const std::vector<AgentInfo>& workers,
                                                       const WorkerTask& task) {
    if (!task.required_capability || task.required_capability->empty()) {
        return select_priority_based(all_of(workers));
    }

    // Capable workers that can still take work; saturated specialists do not block the task
    std::vector<const AgentInfo*> capable;
    for (const auto& worker : workers) {
        if (worker.capabilities.supports(*task.required_capability) && worker.has_spare_capacity()) {
            capable.push_back(&worker);
        }
    }
    if (capable.empty()) {
        return select_priority_based(all_of(workers));
    }
    return select_priority_based(capable);
}

const AgentInfo* LoadBalancer::select_priority_based(const std::vector<const AgentInfo*>& candidates) {
    std::vector<const AgentInfo*> pool;
    for (const AgentInfo* worker : candidates) {
        if (worker->has_spare_capacity()) {
            pool.push_back(worker);
        }
    }
    if (pool.empty()) {
        pool = candidates;
    }

    // Lowest current/max ratio, then lowest absolute count, then input order
    const AgentInfo* best = nullptr;
    for (const AgentInfo* worker : pool) {
        if (best == nullptr) {
            best = worker;
            continue;
        }
        const double ratio = worker->load_ratio();
        const double best_ratio = best->load_ratio();
        if (ratio < best_ratio ||
            (ratio == best_ratio && worker->current_task_count < best->current_task_count)) {
            best = worker;
        }
    }
    return best;
}

} // namespace agentgraph
