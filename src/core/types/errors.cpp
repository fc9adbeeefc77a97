// core/types/errors.cpp
#include "core/types/errors.h"
#include <sstream>

namespace agentgraph {

namespace {

std::string join_violations(const std::vector<std::string>& violations) {
    std::ostringstream oss;
    oss << "Graph validation failed (" << violations.size() << " violation"
        << (violations.size() == 1 ? "" : "s") << ")";
    for (const auto& v : violations) {
        oss << "\n  - " << v;
    }
    return oss.str();
}

} // namespace

GraphValidationError::GraphValidationError(std::vector<std::string> violations)
    : GraphError(join_violations(violations)), violations_(std::move(violations)) {}

const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::RUNNING:   return "running";
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::FAILED:    return "failed";
        case RunStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE:                 return "none";
        case FailureKind::MAX_STEPS:            return "max_steps_exceeded";
        case FailureKind::TIMEOUT:              return "timeout_exceeded";
        case FailureKind::HANDLER_FAILURE:      return "node_handler_failure";
        case FailureKind::NODE_NOT_FOUND:       return "node_not_found";
        case FailureKind::CHECKPOINT_NOT_FOUND: return "checkpoint_not_found";
        case FailureKind::CANCELLED:            return "cancelled";
    }
    return "unknown";
}

} // namespace agentgraph
