// modules/budget/budget_controller.h
#ifndef AGENTGRAPH_MODULES_BUDGET_BUDGET_CONTROLLER_H
#define AGENTGRAPH_MODULES_BUDGET_BUDGET_CONTROLLER_H

#include "core/types/budget.h"
#include "core/types/context.h"
#include <nlohmann/json.hpp>

namespace agentgraph {

// BudgetController 封装了单次执行的步数 / 超时检查
class BudgetController {
public:
    explicit BudgetController(ExecutionBudget budget);

    // Called at each step boundary before the next node runs.
    // Throws MaxStepsExceededError or TimeoutExceededError carrying last_state.
    void check_before_step(const AgentState& last_state) const;

    void consume_step() { ++budget_.steps_used; }

    int steps_used() const { return budget_.steps_used; }

    // Resuming from a checkpoint continues the step count where it stopped
    void restore_steps(int steps_used) { budget_.steps_used = steps_used; }

    const ExecutionBudget& get_budget() const { return budget_; }

    nlohmann::json snapshot() const;

private:
    ExecutionBudget budget_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_BUDGET_BUDGET_CONTROLLER_H
