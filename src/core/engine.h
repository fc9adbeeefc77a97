// core/engine.h
#ifndef AGENTGRAPH_CORE_ENGINE_H
#define AGENTGRAPH_CORE_ENGINE_H

#include "core/stream.h"
#include "core/types/budget.h"
#include "core/types/context.h"
#include "core/types/errors.h"
#include "modules/graph/graph_definition.h"
#include "modules/trace/trace_exporter.h"
#include <memory>
#include <string>
#include <vector>

namespace agentgraph {

class CheckpointStore;
class ExecutionSession;

// Non-throwing outcome of run()
struct ExecutionResult {
    RunStatus status = RunStatus::RUNNING;
    FailureKind failure = FailureKind::NONE;
    std::string message;
    AgentState final_state;            // last state a node completed successfully
    std::vector<TraceRecord> traces;
    std::string execution_id;

    bool success() const { return status == RunStatus::COMPLETED; }
};

// Validated, immutable graph. Any number of runs may use it concurrently;
// every run owns its own ExecutionSession.
class CompiledGraph {
public:
    CompiledGraph(GraphDefinition definition, std::shared_ptr<CheckpointStore> checkpoint_store = nullptr);

    // Runs to completion and returns the final state. Throws GraphExecutionError subclasses
    // on failure and ExecutionCancelledError when the token fires.
    AgentState invoke(AgentState initial_state, const GraphExecutionOptions& options = {}) const;

    // Same as invoke() but reports failures in the result together with the node traces
    ExecutionResult run(AgentState initial_state, const GraphExecutionOptions& options = {}) const;

    GraphStream stream(AgentState initial_state, const GraphExecutionOptions& options = {}) const;

    const GraphDefinition& definition() const { return *definition_; }
    const std::string& name() const { return definition_->name; }
    const std::shared_ptr<CheckpointStore>& checkpoint_store() const { return checkpoint_store_; }

private:
    std::unique_ptr<ExecutionSession> make_session(AgentState initial_state,
                                                   const GraphExecutionOptions& options) const;

    std::shared_ptr<const GraphDefinition> definition_;
    std::shared_ptr<CheckpointStore> checkpoint_store_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_ENGINE_H
