// agent_loop.cpp
// A supervisor graph fans work out to a pool of workers running on a background thread
// and loops until every delegated task reported back.
#include "agentgraph/agentgraph.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

using namespace agentgraph;

namespace {

// Pretend worker: dispatches queued tasks and answers them after a short delay
void run_workers(Supervisor& supervisor, std::atomic<bool>& stop) {
    while (!stop.load()) {
        for (const auto& assignment : supervisor.dispatch()) {
            const auto& task = *assignment.task;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));

            WorkerTaskResult result;
            result.task_id = task.task_id;
            result.worker_id = assignment.worker_id;
            result.execution_time = std::chrono::milliseconds(5);
            if (task.input.value("query", "").empty()) {
                result.success = false;
                result.error_message = "empty query";
            } else {
                result.success = true;
                result.output = {{"answer", "results for " + task.input["query"].get<std::string>()}};
            }
            supervisor.complete_task(result);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
}

} // namespace

int main() {
    try {
        auto pool = std::make_shared<WorkerPool>();
        pool->add_worker("W1", AgentCapabilities{{"summarize"}, {}, 2});
        pool->add_worker("W2", AgentCapabilities{{"search"}, {}, 2});
        pool->add_worker("W3", AgentCapabilities{{}, {"chat"}, 2});

        auto supervisor = std::make_shared<Supervisor>(std::make_shared<InMemoryTaskStore>(), pool);

        GraphBuilder builder("delegation_loop");
        builder
            .add_node("plan", make_delegate_handler(supervisor, [](const AgentState& state) {
                std::vector<WorkerTask> tasks;
                for (const auto& query : state.get("queries")) {
                    WorkerTask task;
                    task.task_type = "search";
                    task.input = {{"query", query}};
                    task.required_capability = "search";
                    tasks.push_back(std::move(task));
                }
                return tasks;
            }))
            .add_node("wait", [](const AgentState& state, const CancellationToken& token) {
                if (!token.is_cancelled()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
                return state;
            })
            .add_node("collect", make_collect_handler(supervisor, [](AgentState state, const TaskResultMap& results) {
                return state.with("collected", static_cast<int>(results.size()));
            }))
            .add_node("summarize", [](const AgentState& state) {
                return state.with_message("assistant",
                                          "completed " + std::to_string(state.get("completed_task_ids").size()) +
                                              ", failed " + std::to_string(state.get("failed_task_ids").size()));
            })
            .add_edge("plan", "wait")
            .add_edge("wait", "collect")
            .add_conditional_edge("collect", tasks_outstanding("wait"), {"wait"})
            .add_edge("collect", "summarize")
            .set_entry_point("plan")
            .add_exit_point("summarize");

        auto graph = builder.compile();

        std::atomic<bool> stop{false};
        std::thread workers(run_workers, std::ref(*supervisor), std::ref(stop));

        AgentState initial;
        initial.values["queries"] = nlohmann::json::array({"weather", "news", "", "stocks", "sports"});

        GraphExecutionOptions options;
        options.max_steps = 500;
        options.timeout = std::chrono::seconds(10);
        auto result = graph->run(initial, options);

        stop = true;
        workers.join();

        if (!result.success()) {
            std::cerr << "[ERROR] " << result.message << "\n";
            return 1;
        }
        std::cout << result.final_state.messages.back().content << "\n";
        std::cout << "Statistics: " << supervisor->statistics().to_json().dump(2) << "\n";
        std::cout << "Results: " << result.final_state.get("task_results").dump(2) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
