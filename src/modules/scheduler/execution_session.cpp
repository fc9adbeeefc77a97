// modules/scheduler/execution_session.cpp
#include "modules/scheduler/execution_session.h"
#include "common/logging/logger.h"
#include "common/utils/id_generator.h"
#include "modules/checkpoint/checkpoint_store.h"
#include <stdexcept>

namespace agentgraph {

namespace {

std::string resolve_execution_id(const GraphExecutionOptions& options) {
    return options.execution_id.empty() ? generate_id("run") : options.execution_id;
}

std::string resolve_checkpoint_id(const GraphExecutionOptions& options, const std::string& execution_id) {
    if (!options.checkpoint_id.empty()) return options.checkpoint_id;
    if (options.resume_from.has_value() && !options.resume_from->empty()) return *options.resume_from;
    return execution_id;
}

} // namespace

ExecutionSession::ExecutionSession(
    std::shared_ptr<const GraphDefinition> graph,
    std::shared_ptr<CheckpointStore> checkpoint_store,
    AgentState initial_state,
    GraphExecutionOptions options)
    : graph_(std::move(graph)),
      checkpoint_store_(std::move(checkpoint_store)),
      options_(std::move(options)),
      budget_controller_(ExecutionBudget(options_)),
      execution_id_(resolve_execution_id(options_)),
      checkpoint_id_(resolve_checkpoint_id(options_, execution_id_)),
      trace_exporter_(execution_id_),
      state_(std::move(initial_state)) {

    if (!graph_) {
        throw std::invalid_argument("ExecutionSession requires a graph");
    }
    if ((options_.enable_checkpoints || options_.resume_from.has_value()) && !checkpoint_store_) {
        throw std::invalid_argument("Checkpointing requires a checkpoint store on the compiled graph");
    }
}

std::optional<GraphEvent> ExecutionSession::next_event() {
    while (pending_.empty()) {
        if (pending_failure_) {
            auto failure = pending_failure_;
            pending_failure_ = nullptr;
            std::rethrow_exception(failure);
        }
        if (phase_ == Phase::DONE) {
            return std::nullopt;
        }

        try {
            advance();
        } catch (...) {
            record_failure(std::current_exception());
            // Events already produced for this step are delivered before the failure
            if (pending_.empty()) throw;
            pending_failure_ = std::current_exception();
        }
    }

    GraphEvent event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

void ExecutionSession::advance() {
    switch (phase_) {
        case Phase::START:
            start();
            break;
        case Phase::BOUNDARY:
            enter_node();
            break;
        case Phase::EXECUTE:
            execute_node();
            break;
        case Phase::FINISHING:
            finish();
            break;
        case Phase::DONE:
            break;
    }
}

void ExecutionSession::start() {
    if (!options_.resume_from.has_value()) {
        if (!graph_->entry_point.has_value()) {
            throw NodeNotFoundError("", "Graph '" + graph_->name + "' has no entry point", state_);
        }
        logger()->info("Starting execution '{}' of graph '{}' at '{}'",
                       execution_id_, graph_->name, *graph_->entry_point);
        state_.step = 0;
        current_ = *graph_->entry_point;
        phase_ = Phase::BOUNDARY;
        return;
    }

    const std::string& resume_id = *options_.resume_from;
    auto checkpoint = checkpoint_store_->load(resume_id);
    if (!checkpoint) {
        throw CheckpointNotFoundError(resume_id);
    }

    state_ = std::move(checkpoint->state);
    budget_controller_.restore_steps(checkpoint->step);
    state_.step = checkpoint->step;
    logger()->info("Resuming execution '{}' from checkpoint '{}' after node '{}' (step {})",
                   execution_id_, resume_id, state_.current_node, checkpoint->step);

    if (!graph_->has_node(state_.current_node)) {
        throw NodeNotFoundError(state_.current_node,
                                "Checkpoint '" + resume_id + "' refers to unknown node '" +
                                    state_.current_node + "'",
                                state_);
    }
    // The recorded node already ran; continue with its successor.
    // No EDGE_TRAVERSED is emitted for this hop since it was not taken in this run.
    current_ = state_.current_node;
    auto decision = evaluate_route(current_, true);
    if (!decision) {
        throw NodeNotFoundError(current_, "Node '" + current_ + "' has no outgoing route", state_);
    }
    if (decision->is_end()) {
        phase_ = Phase::FINISHING;
        return;
    }
    if (!graph_->has_node(decision->target)) {
        throw NodeNotFoundError(decision->target,
                                "Edge from '" + current_ + "' routes to unknown node '" + decision->target + "'",
                                state_);
    }
    current_ = decision->target;
    phase_ = Phase::BOUNDARY;
}

bool ExecutionSession::cancellation_observed() const {
    return cancel_requested_ || options_.cancellation.is_cancelled();
}

void ExecutionSession::enter_node() {
    if (cancellation_observed()) {
        logger()->info("Execution '{}' cancelled before node '{}'", execution_id_, current_);
        status_ = RunStatus::CANCELLED;
        failure_kind_ = FailureKind::CANCELLED;
        failure_message_ = "Graph execution was cancelled";
        phase_ = Phase::DONE;
        return;
    }

    budget_controller_.check_before_step(state_);

    if (graph_->find_handler(current_) == nullptr) {
        throw NodeNotFoundError(current_, "Node '" + current_ + "' not found in graph '" + graph_->name + "'",
                                state_);
    }

    GraphEvent started = make_event(GraphEventType::NODE_STARTED, current_);
    started.step = budget_controller_.steps_used() + 1;
    pending_.push_back(std::move(started));

    trace_exporter_.on_node_start(current_, budget_controller_.steps_used() + 1, budget_controller_.snapshot());
    phase_ = Phase::EXECUTE;
}

void ExecutionSession::execute_node() {
    const NodeHandler& handler = *graph_->find_handler(current_);
    const ValueMap before = state_.values;

    std::optional<AgentState> produced;
    std::exception_ptr error;
    std::string error_message;

    logger()->debug("[{}] executing node '{}'", execution_id_, current_);
    const auto started_at = std::chrono::steady_clock::now();
    try {
        produced = handler(state_, options_.cancellation);
    } catch (const std::exception& e) {
        error = std::current_exception();
        error_message = e.what();
    } catch (...) {
        error = std::current_exception();
        error_message = "unknown exception";
    }
    const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started_at);

    if (error) {
        logger()->error("[{}] node '{}' failed: {}", execution_id_, current_, error_message);

        GraphEvent failed = make_event(GraphEventType::ERROR, current_);
        failed.duration = duration;
        failed.error = error_message;
        failed.step = budget_controller_.steps_used() + 1;
        pending_.push_back(std::move(failed));

        trace_exporter_.on_node_end(current_, "failed", error_message, before, state_.values, std::nullopt,
                                    budget_controller_.snapshot());

        auto failure = std::make_exception_ptr(NodeHandlerError(current_, error, error_message, state_));
        record_failure(failure);
        pending_failure_ = failure;
        phase_ = Phase::DONE;
        return;
    }

    budget_controller_.consume_step();
    state_ = std::move(*produced);
    state_.current_node = current_;
    state_.step = budget_controller_.steps_used();

    GraphEvent completed = make_event(GraphEventType::NODE_COMPLETED, current_);
    completed.duration = duration;
    pending_.push_back(std::move(completed));

    std::optional<std::string> saved_checkpoint;
    if (options_.enable_checkpoints) {
        save_checkpoint();
        saved_checkpoint = checkpoint_id_;
    }
    trace_exporter_.on_node_end(current_, "success", std::nullopt, before, state_.values, saved_checkpoint,
                                budget_controller_.snapshot());

    route_from(current_);
}

void ExecutionSession::route_from(const NodeName& node) {
    auto decision = evaluate_route(node, false);
    if (!decision) {
        if (graph_->is_exit_point(node)) {
            // Terminating at an exit point is not an edge; no EDGE_TRAVERSED
            phase_ = Phase::FINISHING;
            return;
        }
        throw NodeNotFoundError(node,
                                "Node '" + node + "' has no outgoing route and is not an exit point",
                                state_);
    }
    if (!decision->is_end() && !graph_->has_node(decision->target)) {
        throw NodeNotFoundError(decision->target,
                                "Edge from '" + node + "' routes to unknown node '" + decision->target + "'",
                                state_);
    }

    GraphEvent traversed = make_event(GraphEventType::EDGE_TRAVERSED, node);
    traversed.target = decision->target;
    pending_.push_back(std::move(traversed));
    logger()->debug("[{}] edge '{}' -> '{}'", execution_id_, node, decision->target);

    if (decision->is_end()) {
        phase_ = Phase::FINISHING;
    } else {
        current_ = decision->target;
        phase_ = Phase::BOUNDARY;
    }
}

std::optional<EdgeDecision> ExecutionSession::evaluate_route(const NodeName& node, bool exit_fallback) {
    try {
        return exit_fallback ? graph_->route(node, state_) : graph_->route_by_edges(node, state_);
    } catch (const GraphError&) {
        throw;
    } catch (const std::exception& e) {
        // A throwing edge condition counts as a failure of the node it leaves
        const std::string message = std::string("edge condition: ") + e.what();
        logger()->error("[{}] routing out of '{}' failed: {}", execution_id_, node, e.what());

        GraphEvent failed = make_event(GraphEventType::ERROR, node);
        failed.error = message;
        pending_.push_back(std::move(failed));
        throw NodeHandlerError(node, std::current_exception(), message, state_);
    }
}

void ExecutionSession::finish() {
    if (cancellation_observed()) {
        logger()->info("Execution '{}' cancelled before completion", execution_id_);
        status_ = RunStatus::CANCELLED;
        failure_kind_ = FailureKind::CANCELLED;
        failure_message_ = "Graph execution was cancelled";
        phase_ = Phase::DONE;
        return;
    }

    pending_.push_back(make_event(GraphEventType::GRAPH_COMPLETED, current_));
    status_ = RunStatus::COMPLETED;
    phase_ = Phase::DONE;
    logger()->info("Execution '{}' completed after {} step(s)", execution_id_, budget_controller_.steps_used());
}

void ExecutionSession::save_checkpoint() {
    Checkpoint checkpoint;
    checkpoint.checkpoint_id = checkpoint_id_;
    checkpoint.execution_id = execution_id_;
    checkpoint.state = state_;
    checkpoint.step = budget_controller_.steps_used();
    checkpoint_store_->save(checkpoint);
    logger()->debug("[{}] checkpoint '{}' saved at step {}", execution_id_, checkpoint_id_, checkpoint.step);
}

void ExecutionSession::record_failure(std::exception_ptr error) {
    status_ = RunStatus::FAILED;
    phase_ = Phase::DONE;
    try {
        std::rethrow_exception(error);
    } catch (const GraphExecutionError& e) {
        failure_kind_ = e.kind();
        failure_message_ = e.what();
    } catch (const std::exception& e) {
        failure_kind_ = FailureKind::NONE;
        failure_message_ = e.what();
    } catch (...) {
        failure_kind_ = FailureKind::NONE;
        failure_message_ = "unknown error";
    }
    if (failure_kind_ != FailureKind::HANDLER_FAILURE) {
        logger()->error("Execution '{}' failed ({}): {}", execution_id_, to_string(failure_kind_), failure_message_);
    }
}

GraphEvent ExecutionSession::make_event(GraphEventType type, const NodeName& node) const {
    GraphEvent event;
    event.type = type;
    event.node = node;
    event.state = state_;
    event.step = budget_controller_.steps_used();
    event.execution_id = execution_id_;
    return event;
}

} // namespace agentgraph
