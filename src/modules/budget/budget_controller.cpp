// modules/budget/budget_controller.cpp
#include "modules/budget/budget_controller.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace agentgraph {

BudgetController::BudgetController(ExecutionBudget budget)
    : budget_(std::move(budget)) {
    if (budget_.max_steps <= 0) {
        throw std::invalid_argument("max_steps must be greater than zero");
    }
    if (budget_.timeout.has_value() && budget_.timeout->count() < 0) {
        throw std::invalid_argument("timeout cannot be negative");
    }
    budget_.start_time = std::chrono::steady_clock::now();
}

void BudgetController::check_before_step(const AgentState& last_state) const {
    if (budget_.steps_exhausted()) {
        throw MaxStepsExceededError(budget_.max_steps, last_state);
    }
    if (budget_.timed_out()) {
        throw TimeoutExceededError(budget_.timeout->count(), last_state);
    }
}

nlohmann::json BudgetController::snapshot() const {
    nlohmann::json obj;
    obj["max_steps"] = budget_.max_steps;
    obj["steps_used"] = budget_.steps_used;
    obj["elapsed_ms"] = budget_.elapsed().count();
    if (budget_.timeout.has_value()) {
        obj["timeout_ms"] = budget_.timeout->count();
    }
    return obj;
}

} // namespace agentgraph
