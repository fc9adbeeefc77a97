// modules/delegation/supervisor.h
#ifndef AGENTGRAPH_MODULES_DELEGATION_SUPERVISOR_H
#define AGENTGRAPH_MODULES_DELEGATION_SUPERVISOR_H

#include "core/types/task.h"
#include "modules/delegation/load_balancer.h"
#include "modules/delegation/task_store.h"
#include "modules/delegation/worker_pool.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace agentgraph {

struct SupervisorConfig {
    LoadBalancingStrategy default_strategy = LoadBalancingStrategy::CAPABILITY_BASED;
    std::string task_id_prefix = "task";
};

// A task handed to a worker by dispatch(); the worker reports back through complete_task()
struct Assignment {
    std::shared_ptr<const WorkerTask> task;
    WorkerId worker_id;
};

struct SupervisorStatistics {
    int total_submitted = 0;
    int completed = 0;
    int failed = 0;
    int cancelled = 0;
    std::size_t pending = 0;
    std::size_t in_progress = 0;
    std::chrono::milliseconds average_execution_time{0};
    std::map<std::string, int> tasks_by_type;
    std::map<WorkerId, int> tasks_by_worker;

    nlohmann::json to_json() const;
};

// Accepts tasks, persists them and assigns them to pool workers.
// Submission never waits for workers; assignment happens in dispatch(), out of band.
class Supervisor {
public:
    Supervisor(std::shared_ptr<TaskStore> task_store,
               std::shared_ptr<WorkerPool> worker_pool,
               SupervisorConfig config = {});

    // Throws std::invalid_argument for an id that is queued, in flight or finished.
    // submit_tasks checks the whole batch before enqueuing any of it.
    TaskId submit_task(WorkerTask task);
    std::vector<TaskId> submit_tasks(std::vector<WorkerTask> tasks);

    // Assigns queued tasks (highest priority first, FIFO within a priority) until the
    // queue is empty or no worker can take the next task.
    std::vector<Assignment> dispatch(std::optional<LoadBalancingStrategy> strategy = std::nullopt);

    // Stores the result and releases the worker's load. False when the task was not in flight.
    bool complete_task(const WorkerTaskResult& result);

    std::shared_ptr<const WorkerTaskResult> get_result(const TaskId& task_id) const;
    std::optional<TaskStatus> get_status(const TaskId& task_id) const;

    // False for unknown or terminal tasks
    bool cancel_task(const TaskId& task_id);

    SupervisorStatistics statistics() const;
    std::size_t queued_count() const;

    const SupervisorConfig& config() const { return config_; }
    const std::shared_ptr<TaskStore>& task_store() const { return task_store_; }
    const std::shared_ptr<WorkerPool>& worker_pool() const { return worker_pool_; }

private:
    struct QueueEntry {
        int priority;
        uint64_t sequence;
        std::shared_ptr<const WorkerTask> task;
    };
    struct QueueOrder {
        bool operator()(const QueueEntry& a, const QueueEntry& b) const {
            if (a.priority != b.priority) return a.priority < b.priority;
            return a.sequence > b.sequence;
        }
    };
    struct InFlight {
        WorkerId worker_id;
        std::chrono::steady_clock::time_point started_at;
    };

    void check_submittable_locked(const TaskId& task_id) const;
    TaskId enqueue_locked(WorkerTask task);
    void pop_locked();
    const AgentInfo* choose_worker(const std::vector<AgentInfo>& workers, const WorkerTask& task,
                                   LoadBalancingStrategy strategy);

    std::shared_ptr<TaskStore> task_store_;
    std::shared_ptr<WorkerPool> worker_pool_;
    SupervisorConfig config_;
    LoadBalancer load_balancer_;

    mutable std::mutex mutex_;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, QueueOrder> queue_;
    uint64_t next_sequence_ = 0;
    std::unordered_set<TaskId> queued_ids_;
    std::unordered_map<TaskId, InFlight> in_flight_;

    int total_submitted_ = 0;
    int completed_ = 0;
    int failed_ = 0;
    int cancelled_ = 0;
    std::chrono::milliseconds total_execution_time_{0};
    std::map<std::string, int> tasks_by_type_;
    std::map<WorkerId, int> tasks_by_worker_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_DELEGATION_SUPERVISOR_H
