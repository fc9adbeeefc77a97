// modules/delegation/supervisor.cpp
#include "modules/delegation/supervisor.h"
#include "common/logging/logger.h"
#include "common/utils/id_generator.h"
#include <stdexcept>

namespace agentgraph {

nlohmann::json SupervisorStatistics::to_json() const {
    return nlohmann::json{
        {"total_submitted", total_submitted},
        {"completed", completed},
        {"failed", failed},
        {"cancelled", cancelled},
        {"pending", pending},
        {"in_progress", in_progress},
        {"average_execution_time_ms", average_execution_time.count()},
        {"tasks_by_type", tasks_by_type},
        {"tasks_by_worker", tasks_by_worker}
    };
}

Supervisor::Supervisor(std::shared_ptr<TaskStore> task_store,
                       std::shared_ptr<WorkerPool> worker_pool,
                       SupervisorConfig config)
    : task_store_(std::move(task_store)),
      worker_pool_(std::move(worker_pool)),
      config_(std::move(config)) {
    if (!task_store_) {
        throw std::invalid_argument("Supervisor requires a task store");
    }
    if (!worker_pool_) {
        throw std::invalid_argument("Supervisor requires a worker pool");
    }
}

void Supervisor::check_submittable_locked(const TaskId& task_id) const {
    if (task_id.empty()) return;
    if (queued_ids_.count(task_id) != 0 || in_flight_.count(task_id) != 0) {
        throw std::invalid_argument("Task '" + task_id + "' is already submitted");
    }
    auto status = task_store_->get_status(task_id);
    if (status && is_terminal(*status)) {
        throw std::invalid_argument("Task '" + task_id + "' already finished as " + to_string(*status));
    }
}

TaskId Supervisor::enqueue_locked(WorkerTask task) {
    if (task.task_id.empty()) {
        task.task_id = generate_id(config_.task_id_prefix);
    }
    auto shared = std::make_shared<const WorkerTask>(std::move(task));
    task_store_->save(shared);
    queue_.push(QueueEntry{shared->priority, next_sequence_++, shared});
    queued_ids_.insert(shared->task_id);

    ++total_submitted_;
    ++tasks_by_type_[shared->task_type];
    logger()->info("Submitted task '{}' of type '{}' (priority {})",
                   shared->task_id, shared->task_type, shared->priority);
    return shared->task_id;
}

void Supervisor::pop_locked() {
    queued_ids_.erase(queue_.top().task->task_id);
    queue_.pop();
}

TaskId Supervisor::submit_task(WorkerTask task) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_submittable_locked(task.task_id);
    return enqueue_locked(std::move(task));
}

std::vector<TaskId> Supervisor::submit_tasks(std::vector<WorkerTask> tasks) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_set<TaskId> batch;
    for (const auto& task : tasks) {
        check_submittable_locked(task.task_id);
        if (!task.task_id.empty() && !batch.insert(task.task_id).second) {
            throw std::invalid_argument("Task '" + task.task_id + "' appears twice in one submission");
        }
    }

    std::vector<TaskId> ids;
    ids.reserve(tasks.size());
    for (auto& task : tasks) {
        ids.push_back(enqueue_locked(std::move(task)));
    }
    return ids;
}

const AgentInfo* Supervisor::choose_worker(const std::vector<AgentInfo>& workers, const WorkerTask& task,
                                           LoadBalancingStrategy strategy) {
    if (task.preferred_worker_id) {
        for (const auto& worker : workers) {
            if (worker.worker_id == *task.preferred_worker_id && worker.has_spare_capacity()) {
                return &worker;
            }
        }
    }
    const AgentInfo* selected = load_balancer_.select_worker(workers, task, strategy);
    if (selected != nullptr && !selected->has_spare_capacity() &&
        strategy != LoadBalancingStrategy::PRIORITY_BASED) {
        // The cursor or the dice landed on a full worker; take the least loaded one instead
        selected = load_balancer_.select_worker(workers, task, LoadBalancingStrategy::PRIORITY_BASED);
    }
    return selected;
}

std::vector<Assignment> Supervisor::dispatch(std::optional<LoadBalancingStrategy> strategy) {
    const LoadBalancingStrategy effective = strategy.value_or(config_.default_strategy);
    std::vector<Assignment> assignments;

    std::lock_guard<std::mutex> lock(mutex_);
    while (!queue_.empty()) {
        auto task = queue_.top().task;

        // Cancelled while queued
        auto status = task_store_->get_status(task->task_id);
        if (!status || *status != TaskStatus::PENDING) {
            pop_locked();
            continue;
        }

        const auto workers = worker_pool_->snapshot();
        const AgentInfo* worker = choose_worker(workers, *task, effective);
        if (worker == nullptr || !worker->has_spare_capacity()) {
            logger()->debug("No worker available for task '{}'; {} task(s) stay queued",
                            task->task_id, queue_.size());
            break;
        }
        const WorkerId worker_id = worker->worker_id;

        pop_locked();
        worker_pool_->increment_load(worker_id);
        task_store_->update_status(task->task_id, TaskStatus::IN_PROGRESS);
        in_flight_[task->task_id] = InFlight{worker_id, std::chrono::steady_clock::now()};
        ++tasks_by_worker_[worker_id];

        logger()->info("Assigned task '{}' to worker '{}' ({})", task->task_id, worker_id, to_string(effective));
        assignments.push_back(Assignment{std::move(task), worker_id});
    }
    return assignments;
}

bool Supervisor::complete_task(const WorkerTaskResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(result.task_id);
    if (it == in_flight_.end()) {
        logger()->warn("Result for task '{}' ignored: task is not in progress", result.task_id);
        return false;
    }

    task_store_->save_result(std::make_shared<const WorkerTaskResult>(result));
    worker_pool_->decrement_load(it->second.worker_id);
    in_flight_.erase(it);

    total_execution_time_ += result.execution_time;
    if (result.success) {
        ++completed_;
        logger()->info("Task '{}' completed by worker '{}'", result.task_id, result.worker_id);
    } else {
        ++failed_;
        logger()->warn("Task '{}' failed on worker '{}': {}", result.task_id, result.worker_id,
                       result.error_message.value_or("unknown error"));
    }
    return true;
}

std::shared_ptr<const WorkerTaskResult> Supervisor::get_result(const TaskId& task_id) const {
    return task_store_->get_result(task_id);
}

std::optional<TaskStatus> Supervisor::get_status(const TaskId& task_id) const {
    return task_store_->get_status(task_id);
}

bool Supervisor::cancel_task(const TaskId& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!task_store_->update_status(task_id, TaskStatus::CANCELLED)) {
        return false;
    }
    if (auto it = in_flight_.find(task_id); it != in_flight_.end()) {
        worker_pool_->decrement_load(it->second.worker_id);
        in_flight_.erase(it);
    }
    ++cancelled_;
    logger()->info("Cancelled task '{}'", task_id);
    return true;
}

SupervisorStatistics Supervisor::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SupervisorStatistics stats;
    stats.total_submitted = total_submitted_;
    stats.completed = completed_;
    stats.failed = failed_;
    stats.cancelled = cancelled_;
    stats.pending = task_store_->list(TaskStatus::PENDING).size();
    stats.in_progress = in_flight_.size();
    const int finished = completed_ + failed_;
    if (finished > 0) {
        stats.average_execution_time = total_execution_time_ / finished;
    }
    stats.tasks_by_type = tasks_by_type_;
    stats.tasks_by_worker = tasks_by_worker_;
    return stats;
}

std::size_t Supervisor::queued_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace agentgraph
