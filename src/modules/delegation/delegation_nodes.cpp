// modules/delegation/delegation_nodes.cpp
#include "modules/delegation/delegation_nodes.h"
#include "common/logging/logger.h"
#include <stdexcept>

namespace agentgraph {

namespace {

Value id_list(const AgentState& state, const char* key) {
    const Value& v = state.get(key);
    return v.is_array() ? v : Value::array();
}

} // namespace

NodeHandler make_delegate_handler(std::shared_ptr<Supervisor> supervisor, TaskFactory factory) {
    if (!supervisor || !factory) {
        throw std::invalid_argument("Delegate node requires a supervisor and a task factory");
    }
    return [supervisor = std::move(supervisor), factory = std::move(factory)](
               const AgentState& state, const CancellationToken&) {
        auto ids = supervisor->submit_tasks(factory(state));

        Value pending = id_list(state, kPendingTaskIds);
        for (const auto& id : ids) {
            pending.push_back(id);
        }
        logger()->debug("Delegated {} task(s); {} pending", ids.size(), pending.size());
        return state.with(kPendingTaskIds, std::move(pending));
    };
}

NodeHandler make_collect_handler(std::shared_ptr<Supervisor> supervisor, ResultAggregator aggregator) {
    if (!supervisor) {
        throw std::invalid_argument("Collect node requires a supervisor");
    }
    return [supervisor = std::move(supervisor), aggregator = std::move(aggregator)](
               const AgentState& state, const CancellationToken&) {
        Value still_pending = Value::array();
        Value completed = id_list(state, kCompletedTaskIds);
        Value failed = id_list(state, kFailedTaskIds);
        Value results = state.get(kTaskResults).is_object() ? state.get(kTaskResults) : Value::object();

        for (const auto& id_value : id_list(state, kPendingTaskIds)) {
            const TaskId id = id_value.get<TaskId>();
            const auto status = supervisor->get_status(id);

            if (status == TaskStatus::COMPLETED || status == TaskStatus::FAILED) {
                if (auto result = supervisor->get_result(id)) {
                    results[id] = *result;
                }
                (status == TaskStatus::COMPLETED ? completed : failed).push_back(id);
            } else if (status == TaskStatus::CANCELLED || !status) {
                // Nothing will ever report back for these
                failed.push_back(id);
            } else {
                still_pending.push_back(id);
            }
        }

        AgentState next = state.with(kPendingTaskIds, still_pending)
                              .with(kCompletedTaskIds, completed)
                              .with(kFailedTaskIds, failed)
                              .with(kTaskResults, results);

        if (!aggregator) {
            return next;
        }
        TaskResultMap gathered;
        for (const auto* list : {&completed, &failed}) {
            for (const auto& id_value : *list) {
                const TaskId id = id_value.get<TaskId>();
                if (auto result = supervisor->get_result(id)) {
                    gathered.emplace(id, std::move(result));
                }
            }
        }
        return aggregator(std::move(next), gathered);
    };
}

EdgeCondition tasks_outstanding(NodeName target) {
    return [target = std::move(target)](const AgentState& state) -> std::optional<EdgeDecision> {
        const Value& pending = state.get(kPendingTaskIds);
        if (pending.is_array() && !pending.empty()) {
            return EdgeDecision::to(target);
        }
        return std::nullopt;
    };
}

} // namespace agentgraph
