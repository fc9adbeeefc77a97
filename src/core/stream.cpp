// core/stream.cpp
#include "core/stream.h"
#include "modules/scheduler/execution_session.h"

namespace agentgraph {

GraphStream::GraphStream(std::unique_ptr<ExecutionSession> session) : session_(std::move(session)) {}

GraphStream::~GraphStream() = default;
GraphStream::GraphStream(GraphStream&&) noexcept = default;
GraphStream& GraphStream::operator=(GraphStream&&) noexcept = default;

std::optional<GraphEvent> GraphStream::next() {
    return session_->next_event();
}

void GraphStream::cancel() {
    session_->cancel();
}

RunStatus GraphStream::status() const {
    return session_->status();
}

const AgentState& GraphStream::state() const {
    return session_->state();
}

const std::string& GraphStream::execution_id() const {
    return session_->execution_id();
}

} // namespace agentgraph
