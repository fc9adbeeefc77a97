#ifndef AGENTGRAPH_TYPES_BUDGET_H
#define AGENTGRAPH_TYPES_BUDGET_H

#include "cancellation.h"
#include <chrono>
#include <optional>
#include <string>

namespace agentgraph {

// Per-invocation configuration
struct GraphExecutionOptions {
    int max_steps = 100;                               // must be > 0
    std::optional<std::chrono::milliseconds> timeout;  // unset = no wall-clock limit
    bool enable_checkpoints = false;
    std::string checkpoint_id;                         // empty: resume_from, else execution_id
    std::optional<std::string> resume_from;            // checkpoint id to resume from
    std::string execution_id;                          // generated when empty
    CancellationToken cancellation;
};

// 执行预算: step / time counters of one run
struct ExecutionBudget {
    int max_steps = 100;
    std::optional<std::chrono::milliseconds> timeout;
    int steps_used = 0;
    std::chrono::steady_clock::time_point start_time;

    ExecutionBudget() : start_time(std::chrono::steady_clock::now()) {}

    explicit ExecutionBudget(const GraphExecutionOptions& options)
        : max_steps(options.max_steps),
          timeout(options.timeout),
          start_time(std::chrono::steady_clock::now()) {}

    // True when executing one more node would exceed max_steps
    bool steps_exhausted() const { return steps_used + 1 > max_steps; }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
    }

    bool timed_out() const {
        return timeout.has_value() && elapsed() > *timeout;
    }
};

} // namespace agentgraph

#endif // AGENTGRAPH_TYPES_BUDGET_H
