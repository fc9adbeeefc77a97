#ifndef AGENTGRAPH_TYPES_ERRORS_H
#define AGENTGRAPH_TYPES_ERRORS_H

#include "context.h"
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace agentgraph {

enum class RunStatus : uint8_t {
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class FailureKind : uint8_t {
    NONE,
    MAX_STEPS,
    TIMEOUT,
    HANDLER_FAILURE,
    NODE_NOT_FOUND,
    CHECKPOINT_NOT_FOUND,
    CANCELLED
};

const char* to_string(RunStatus status);
const char* to_string(FailureKind kind);

// Base of every graph structure / execution error
class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// compile() found structural defects; violations() lists all of them
class GraphValidationError : public GraphError {
public:
    explicit GraphValidationError(std::vector<std::string> violations);
    const std::vector<std::string>& violations() const { return violations_; }

private:
    std::vector<std::string> violations_;
};

class DuplicateNodeError : public GraphError {
public:
    explicit DuplicateNodeError(const NodeName& node)
        : GraphError("Node '" + node + "' already exists"), node_(node) {}
    const NodeName& node() const { return node_; }

private:
    NodeName node_;
};

// Run-time failure. Carries the last state that a node completed successfully.
class GraphExecutionError : public GraphError {
public:
    GraphExecutionError(FailureKind kind, const std::string& message, AgentState last_state)
        : GraphError(message), kind_(kind), last_state_(std::move(last_state)) {}

    FailureKind kind() const { return kind_; }
    const AgentState& last_state() const { return last_state_; }

private:
    FailureKind kind_;
    AgentState last_state_;
};

// Raised by the builder for unregistered endpoints, and at run time when a route
// names an unknown node or a non-exit node has nowhere to go.
class NodeNotFoundError : public GraphExecutionError {
public:
    NodeNotFoundError(const NodeName& node, const std::string& message, AgentState last_state = {})
        : GraphExecutionError(FailureKind::NODE_NOT_FOUND, message, std::move(last_state)), node_(node) {}
    const NodeName& node() const { return node_; }

private:
    NodeName node_;
};

class MaxStepsExceededError : public GraphExecutionError {
public:
    MaxStepsExceededError(int max_steps, AgentState last_state)
        : GraphExecutionError(FailureKind::MAX_STEPS,
                              "Graph execution exceeded maximum steps (" + std::to_string(max_steps) + ")",
                              std::move(last_state)),
          max_steps_(max_steps) {}
    int max_steps() const { return max_steps_; }

private:
    int max_steps_;
};

class TimeoutExceededError : public GraphExecutionError {
public:
    TimeoutExceededError(long long timeout_ms, AgentState last_state)
        : GraphExecutionError(FailureKind::TIMEOUT,
                              "Graph execution exceeded timeout of " + std::to_string(timeout_ms) + "ms",
                              std::move(last_state)) {}
};

// Wraps whatever a node handler threw. No retry is attempted by the engine.
class NodeHandlerError : public GraphExecutionError {
public:
    NodeHandlerError(const NodeName& node, std::exception_ptr cause, const std::string& cause_message,
                     AgentState last_state)
        : GraphExecutionError(FailureKind::HANDLER_FAILURE,
                              "Error executing node '" + node + "': " + cause_message,
                              std::move(last_state)),
          node_(node), cause_(std::move(cause)), cause_message_(cause_message) {}

    const NodeName& node() const { return node_; }
    std::exception_ptr cause() const { return cause_; }
    const std::string& cause_message() const { return cause_message_; }

    [[noreturn]] void rethrow_cause() const { std::rethrow_exception(cause_); }

private:
    NodeName node_;
    std::exception_ptr cause_;
    std::string cause_message_;
};

class ExecutionCancelledError : public GraphExecutionError {
public:
    explicit ExecutionCancelledError(AgentState last_state)
        : GraphExecutionError(FailureKind::CANCELLED, "Graph execution was cancelled", std::move(last_state)) {}
};

class CheckpointNotFoundError : public GraphExecutionError {
public:
    explicit CheckpointNotFoundError(const std::string& checkpoint_id)
        : GraphExecutionError(FailureKind::CHECKPOINT_NOT_FOUND,
                              "Checkpoint '" + checkpoint_id + "' not found", AgentState{}),
          checkpoint_id_(checkpoint_id) {}
    const std::string& checkpoint_id() const { return checkpoint_id_; }

private:
    std::string checkpoint_id_;
};

// Local precondition failure of a TaskStore call (null task / result, empty id)
class TaskStoreError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace agentgraph

#endif // AGENTGRAPH_TYPES_ERRORS_H
