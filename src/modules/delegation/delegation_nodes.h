// modules/delegation/delegation_nodes.h
#ifndef AGENTGRAPH_MODULES_DELEGATION_DELEGATION_NODES_H
#define AGENTGRAPH_MODULES_DELEGATION_DELEGATION_NODES_H

#include "modules/delegation/supervisor.h"
#include "modules/graph/graph_definition.h"
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace agentgraph {

// Keys in AgentState::values shared by the delegation nodes
inline constexpr const char* kPendingTaskIds = "pending_task_ids";
inline constexpr const char* kCompletedTaskIds = "completed_task_ids";
inline constexpr const char* kFailedTaskIds = "failed_task_ids";
inline constexpr const char* kTaskResults = "task_results";

using TaskFactory = std::function<std::vector<WorkerTask>(const AgentState&)>;
using TaskResultMap = std::map<TaskId, std::shared_ptr<const WorkerTaskResult>>;
using ResultAggregator = std::function<AgentState(AgentState, const TaskResultMap&)>;

// Submits the tasks the factory builds and appends their ids to values["pending_task_ids"]
NodeHandler make_delegate_handler(std::shared_ptr<Supervisor> supervisor, TaskFactory factory);

// Polls without blocking: finished ids move from pending to completed / failed, their results
// land in values["task_results"], then the aggregator (optional) sees every result gathered so far.
// Pair it with tasks_outstanding() to loop until the pending list is empty.
NodeHandler make_collect_handler(std::shared_ptr<Supervisor> supervisor, ResultAggregator aggregator = nullptr);

// Routes to target while values["pending_task_ids"] is non-empty
EdgeCondition tasks_outstanding(NodeName target);

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_DELEGATION_DELEGATION_NODES_H
