#ifndef AGENTGRAPH_TYPES_TASK_H
#define AGENTGRAPH_TYPES_TASK_H

#include "context.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace agentgraph {

using TaskId = std::string;
using WorkerId = std::string;

// Pending -> InProgress -> {Completed, Failed, Blocked, Review, Cancelled}
// Completed / Failed / Cancelled are terminal.
enum class TaskStatus : uint8_t {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED,
    BLOCKED,
    REVIEW,
    CANCELLED
};

enum class LoadBalancingStrategy : uint8_t {
    ROUND_ROBIN,
    CAPABILITY_BASED,
    PRIORITY_BASED,
    RANDOM
};

const char* to_string(TaskStatus status);
const char* to_string(LoadBalancingStrategy strategy);
std::optional<TaskStatus> parse_task_status(const std::string& s);
std::optional<LoadBalancingStrategy> parse_strategy(const std::string& s);

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED || status == TaskStatus::CANCELLED;
}

struct WorkerTask {
    TaskId task_id;                                 // generated on submit when empty
    std::string task_type;
    Value input = Value::object();
    std::optional<std::string> required_capability; // tool or intent name
    int priority = 0;                               // higher runs first
    std::optional<WorkerId> preferred_worker_id;
};

struct WorkerTaskResult {
    TaskId task_id;
    bool success = false;
    Value output;                                   // set on success
    std::optional<std::string> error_message;       // set on failure
    WorkerId worker_id;
    std::chrono::milliseconds execution_time{0};

    bool operator==(const WorkerTaskResult&) const = default;
};

struct AgentCapabilities {
    std::set<std::string> supported_tools;
    std::set<std::string> supported_intents;
    int max_concurrent_tasks = 1;

    bool supports(const std::string& capability) const {
        return supported_tools.count(capability) > 0 || supported_intents.count(capability) > 0;
    }
};

// Snapshot of a worker's advertised state
struct AgentInfo {
    WorkerId worker_id;
    AgentCapabilities capabilities;
    int current_task_count = 0;

    bool has_spare_capacity() const { return current_task_count < capabilities.max_concurrent_tasks; }

    // current / max; a worker that accepts nothing counts as fully loaded
    double load_ratio() const;
};

void to_json(nlohmann::json& j, const WorkerTask& task);
void from_json(const nlohmann::json& j, WorkerTask& task);
void to_json(nlohmann::json& j, const WorkerTaskResult& result);
void from_json(const nlohmann::json& j, WorkerTaskResult& result);

} // namespace agentgraph

#endif // AGENTGRAPH_TYPES_TASK_H
