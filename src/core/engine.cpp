// core/engine.cpp
#include "core/engine.h"
#include "modules/checkpoint/checkpoint_store.h"
#include "modules/scheduler/execution_session.h"

namespace agentgraph {

CompiledGraph::CompiledGraph(GraphDefinition definition, std::shared_ptr<CheckpointStore> checkpoint_store)
    : definition_(std::make_shared<const GraphDefinition>(std::move(definition))),
      checkpoint_store_(std::move(checkpoint_store)) {}

std::unique_ptr<ExecutionSession> CompiledGraph::make_session(AgentState initial_state,
                                                              const GraphExecutionOptions& options) const {
    return std::make_unique<ExecutionSession>(definition_, checkpoint_store_, std::move(initial_state), options);
}

AgentState CompiledGraph::invoke(AgentState initial_state, const GraphExecutionOptions& options) const {
    auto session = make_session(std::move(initial_state), options);
    while (session->next_event()) {
    }
    if (session->status() == RunStatus::CANCELLED) {
        throw ExecutionCancelledError(session->state());
    }
    return session->state();
}

ExecutionResult CompiledGraph::run(AgentState initial_state, const GraphExecutionOptions& options) const {
    ExecutionResult result;
    auto session = make_session(std::move(initial_state), options);
    result.execution_id = session->execution_id();

    try {
        while (session->next_event()) {
        }
        result.status = session->status();
        result.failure = session->failure_kind();
        result.message = session->status() == RunStatus::COMPLETED ? "Execution completed"
                                                                   : session->failure_message();
        result.final_state = session->state();
    } catch (const GraphExecutionError& e) {
        result.status = RunStatus::FAILED;
        result.failure = e.kind();
        result.message = e.what();
        result.final_state = e.last_state();
    } catch (const std::exception& e) {
        // e.g. a checkpoint store that refused the state
        result.status = RunStatus::FAILED;
        result.failure = session->failure_kind();
        result.message = e.what();
        result.final_state = session->state();
    }

    result.traces = session->get_trace_exporter().get_traces();
    return result;
}

GraphStream CompiledGraph::stream(AgentState initial_state, const GraphExecutionOptions& options) const {
    return GraphStream(make_session(std::move(initial_state), options));
}

} // namespace agentgraph
