// modules/delegation/task_store.h
#ifndef AGENTGRAPH_MODULES_DELEGATION_TASK_STORE_H
#define AGENTGRAPH_MODULES_DELEGATION_TASK_STORE_H

#include "core/types/task.h"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace agentgraph {

// Persistence for delegated tasks, their results and statuses.
// Lookups of unknown ids return nullptr / std::nullopt / false; only broken arguments throw TaskStoreError.
class TaskStore {
public:
    virtual ~TaskStore() = default;

    // Upsert; the status becomes PENDING unless the task already finished
    virtual void save(std::shared_ptr<const WorkerTask> task) = 0;
    virtual std::shared_ptr<const WorkerTask> get(const TaskId& task_id) const = 0;

    // Stores the result and sets COMPLETED / FAILED from result->success in one step
    virtual void save_result(std::shared_ptr<const WorkerTaskResult> result) = 0;
    virtual std::shared_ptr<const WorkerTaskResult> get_result(const TaskId& task_id) const = 0;

    virtual std::optional<TaskStatus> get_status(const TaskId& task_id) const = 0;

    // False when the id is unknown or the task already reached a terminal status
    virtual bool update_status(const TaskId& task_id, TaskStatus status) = 0;

    virtual std::vector<std::shared_ptr<const WorkerTask>> list(TaskStatus status) const = 0;
};

class InMemoryTaskStore : public TaskStore {
public:
    void save(std::shared_ptr<const WorkerTask> task) override;
    std::shared_ptr<const WorkerTask> get(const TaskId& task_id) const override;
    void save_result(std::shared_ptr<const WorkerTaskResult> result) override;
    std::shared_ptr<const WorkerTaskResult> get_result(const TaskId& task_id) const override;
    std::optional<TaskStatus> get_status(const TaskId& task_id) const override;
    bool update_status(const TaskId& task_id, TaskStatus status) override;
    std::vector<std::shared_ptr<const WorkerTask>> list(TaskStatus status) const override;

    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<TaskId, std::shared_ptr<const WorkerTask>> tasks_;
    std::unordered_map<TaskId, std::shared_ptr<const WorkerTaskResult>> results_;
    std::unordered_map<TaskId, TaskStatus> statuses_;
    std::vector<TaskId> order_; // insertion order for list()
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_DELEGATION_TASK_STORE_H
