// core/types/task.cpp
#include "core/types/task.h"
#include <limits>

namespace agentgraph {

const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING:     return "pending";
        case TaskStatus::IN_PROGRESS: return "in_progress";
        case TaskStatus::COMPLETED:   return "completed";
        case TaskStatus::FAILED:      return "failed";
        case TaskStatus::BLOCKED:     return "blocked";
        case TaskStatus::REVIEW:      return "review";
        case TaskStatus::CANCELLED:   return "cancelled";
    }
    return "unknown";
}

const char* to_string(LoadBalancingStrategy strategy) {
    switch (strategy) {
        case LoadBalancingStrategy::ROUND_ROBIN:      return "round_robin";
        case LoadBalancingStrategy::CAPABILITY_BASED: return "capability_based";
        case LoadBalancingStrategy::PRIORITY_BASED:   return "priority_based";
        case LoadBalancingStrategy::RANDOM:           return "random";
    }
    return "unknown";
}

std::optional<TaskStatus> parse_task_status(const std::string& s) {
    if (s == "pending") return TaskStatus::PENDING;
    if (s == "in_progress") return TaskStatus::IN_PROGRESS;
    if (s == "completed") return TaskStatus::COMPLETED;
    if (s == "failed") return TaskStatus::FAILED;
    if (s == "blocked") return TaskStatus::BLOCKED;
    if (s == "review") return TaskStatus::REVIEW;
    if (s == "cancelled") return TaskStatus::CANCELLED;
    return std::nullopt;
}

std::optional<LoadBalancingStrategy> parse_strategy(const std::string& s) {
    if (s == "round_robin") return LoadBalancingStrategy::ROUND_ROBIN;
    if (s == "capability_based") return LoadBalancingStrategy::CAPABILITY_BASED;
    if (s == "priority_based") return LoadBalancingStrategy::PRIORITY_BASED;
    if (s == "random") return LoadBalancingStrategy::RANDOM;
    return std::nullopt;
}

double AgentInfo::load_ratio() const {
    if (capabilities.max_concurrent_tasks <= 0) {
        return std::numeric_limits<double>::infinity();
    }
    return static_cast<double>(current_task_count) / capabilities.max_concurrent_tasks;
}

void to_json(nlohmann::json& j, const WorkerTask& task) {
    j = nlohmann::json{
        {"task_id", task.task_id},
        {"task_type", task.task_type},
        {"input", task.input},
        {"priority", task.priority}
    };
    if (task.required_capability) j["required_capability"] = *task.required_capability;
    if (task.preferred_worker_id) j["preferred_worker_id"] = *task.preferred_worker_id;
}

void from_json(const nlohmann::json& j, WorkerTask& task) {
    task = WorkerTask{};
    task.task_id = j.value("task_id", "");
    task.task_type = j.value("task_type", "");
    task.input = j.value("input", nlohmann::json::object());
    task.priority = j.value("priority", 0);
    if (j.contains("required_capability")) task.required_capability = j.at("required_capability").get<std::string>();
    if (j.contains("preferred_worker_id")) task.preferred_worker_id = j.at("preferred_worker_id").get<std::string>();
}

void to_json(nlohmann::json& j, const WorkerTaskResult& result) {
    j = nlohmann::json{
        {"task_id", result.task_id},
        {"success", result.success},
        {"output", result.output},
        {"worker_id", result.worker_id},
        {"execution_time_ms", result.execution_time.count()}
    };
    if (result.error_message) j["error_message"] = *result.error_message;
}

void from_json(const nlohmann::json& j, WorkerTaskResult& result) {
    result = WorkerTaskResult{};
    result.task_id = j.value("task_id", "");
    result.success = j.value("success", false);
    if (j.contains("output")) result.output = j.at("output");
    result.worker_id = j.value("worker_id", "");
    result.execution_time = std::chrono::milliseconds(j.value("execution_time_ms", 0LL));
    if (j.contains("error_message")) result.error_message = j.at("error_message").get<std::string>();
}

} // namespace agentgraph
