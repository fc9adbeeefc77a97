// modules/delegation/task_store.cpp
#include "modules/delegation/task_store.h"
#include "core/types/errors.h"
#include <mutex>

namespace agentgraph {

void InMemoryTaskStore::save(std::shared_ptr<const WorkerTask> task) {
    if (!task) {
        throw TaskStoreError("Task cannot be null");
    }
    if (task->task_id.empty()) {
        throw TaskStoreError("Task ID cannot be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const TaskId id = task->task_id;
    if (tasks_.insert_or_assign(id, std::move(task)).second) {
        order_.push_back(id);
    }
    // A finished task keeps its status and result; only the payload is replaced
    auto it = statuses_.find(id);
    if (it == statuses_.end()) {
        statuses_.emplace(id, TaskStatus::PENDING);
    } else if (!is_terminal(it->second)) {
        it->second = TaskStatus::PENDING;
    }
}

std::shared_ptr<const WorkerTask> InMemoryTaskStore::get(const TaskId& task_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    return it != tasks_.end() ? it->second : nullptr;
}

void InMemoryTaskStore::save_result(std::shared_ptr<const WorkerTaskResult> result) {
    if (!result) {
        throw TaskStoreError("Task result cannot be null");
    }
    if (result->task_id.empty()) {
        throw TaskStoreError("Task result must name a task ID");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const TaskId id = result->task_id;
    const TaskStatus status = result->success ? TaskStatus::COMPLETED : TaskStatus::FAILED;
    results_.insert_or_assign(id, std::move(result));
    statuses_[id] = status;
}

std::shared_ptr<const WorkerTaskResult> InMemoryTaskStore::get_result(const TaskId& task_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = results_.find(task_id);
    return it != results_.end() ? it->second : nullptr;
}

std::optional<TaskStatus> InMemoryTaskStore::get_status(const TaskId& task_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = statuses_.find(task_id);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryTaskStore::update_status(const TaskId& task_id, TaskStatus status) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = statuses_.find(task_id);
    if (it == statuses_.end() || is_terminal(it->second)) {
        return false;
    }
    it->second = status;
    return true;
}

std::vector<std::shared_ptr<const WorkerTask>> InMemoryTaskStore::list(TaskStatus status) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<const WorkerTask>> out;
    for (const auto& id : order_) {
        auto status_it = statuses_.find(id);
        auto task_it = tasks_.find(id);
        if (status_it != statuses_.end() && status_it->second == status && task_it != tasks_.end()) {
            out.push_back(task_it->second);
        }
    }
    return out;
}

std::size_t InMemoryTaskStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace agentgraph
