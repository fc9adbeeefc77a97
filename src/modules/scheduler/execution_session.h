// modules/scheduler/execution_session.h
#ifndef AGENTGRAPH_MODULES_SCHEDULER_EXECUTION_SESSION_H
#define AGENTGRAPH_MODULES_SCHEDULER_EXECUTION_SESSION_H

#include "core/types/budget.h"
#include "core/types/context.h"
#include "core/types/errors.h"
#include "core/types/event.h"
#include "modules/budget/budget_controller.h"
#include "modules/graph/graph_definition.h"
#include "modules/trace/trace_exporter.h"
#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

class CheckpointStore;

// ExecutionSession 封装了单次执行的所有状态和逻辑.
// One sequential state machine: a node only starts after the previous handler returned
// and its route was resolved. invoke(), run() and stream() all drive this class.
class ExecutionSession {
public:
    ExecutionSession(
        std::shared_ptr<const GraphDefinition> graph,
        std::shared_ptr<CheckpointStore> checkpoint_store,
        AgentState initial_state,
        GraphExecutionOptions options
    );

    // Runs at most one node and returns the next event in execution order.
    // std::nullopt once the run is over (completed or cancelled). Failures are thrown,
    // after any events that precede them have been handed out.
    std::optional<GraphEvent> next_event();

    // Observed at the next step boundary; never interrupts a running handler
    void cancel() { cancel_requested_ = true; }

    RunStatus status() const { return status_; }
    FailureKind failure_kind() const { return failure_kind_; }
    const std::string& failure_message() const { return failure_message_; }
    const AgentState& state() const { return state_; }
    const std::string& execution_id() const { return execution_id_; }
    const std::string& checkpoint_id() const { return checkpoint_id_; }
    int steps_used() const { return budget_controller_.steps_used(); }

    const TraceExporter& get_trace_exporter() const { return trace_exporter_; }
    const BudgetController& get_budget_controller() const { return budget_controller_; }

private:
    enum class Phase { START, BOUNDARY, EXECUTE, FINISHING, DONE };

    void advance();
    void start();
    void enter_node();
    void execute_node();
    void route_from(const NodeName& node);
    // exit_fallback: exit points route to __end__. Condition failures become NodeHandlerError
    // after an ERROR event for the node.
    std::optional<EdgeDecision> evaluate_route(const NodeName& node, bool exit_fallback);
    void finish();
    void save_checkpoint();
    void record_failure(std::exception_ptr error);
    bool cancellation_observed() const;

    GraphEvent make_event(GraphEventType type, const NodeName& node) const;

    std::shared_ptr<const GraphDefinition> graph_;
    std::shared_ptr<CheckpointStore> checkpoint_store_;
    GraphExecutionOptions options_;
    BudgetController budget_controller_;
    std::string execution_id_;
    std::string checkpoint_id_;
    TraceExporter trace_exporter_;

    AgentState state_;
    NodeName current_;
    Phase phase_ = Phase::START;
    RunStatus status_ = RunStatus::RUNNING;
    FailureKind failure_kind_ = FailureKind::NONE;
    std::string failure_message_;
    bool cancel_requested_ = false;

    std::deque<GraphEvent> pending_;      // events of the current step only
    std::exception_ptr pending_failure_;  // thrown once pending_ drains
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_SCHEDULER_EXECUTION_SESSION_H
