// tests/test_supervisor.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/engine.h"
#include "modules/delegation/delegation_nodes.h"
#include "modules/delegation/supervisor.h"
#include "modules/graph/graph_builder.h"

using namespace agentgraph;

namespace {

struct Fixture {
    std::shared_ptr<InMemoryTaskStore> store = std::make_shared<InMemoryTaskStore>();
    std::shared_ptr<WorkerPool> pool = std::make_shared<WorkerPool>();
    std::shared_ptr<Supervisor> supervisor;

    explicit Fixture(SupervisorConfig config = {}) {
        pool->add_worker("W1", AgentCapabilities{{"summarize"}, {}, 2});
        pool->add_worker("W2", AgentCapabilities{{"search"}, {}, 2});
        pool->add_worker("W3", AgentCapabilities{{}, {"chat"}, 2});
        supervisor = std::make_shared<Supervisor>(store, pool, config);
    }
};

WorkerTask search_task(int priority = 0) {
    WorkerTask task;
    task.task_type = "search";
    task.required_capability = "search";
    task.priority = priority;
    return task;
}

WorkerTaskResult result_for(const Assignment& a, bool success) {
    WorkerTaskResult r;
    r.task_id = a.task->task_id;
    r.worker_id = a.worker_id;
    r.success = success;
    r.execution_time = std::chrono::milliseconds(10);
    if (success) {
        r.output = {{"from", a.worker_id}};
    } else {
        r.error_message = "failed on " + a.worker_id;
    }
    return r;
}

} // namespace

TEST_CASE("Five capability tasks fill the specialist, then spread by load", "[supervisor]") {
    Fixture f;
    auto ids = f.supervisor->submit_tasks({search_task(), search_task(), search_task(), search_task(), search_task()});
    REQUIRE(ids.size() == 5);

    auto assignments = f.supervisor->dispatch(LoadBalancingStrategy::CAPABILITY_BASED);
    REQUIRE(assignments.size() == 5);

    std::vector<std::string> workers;
    for (const auto& a : assignments) workers.push_back(a.worker_id);
    REQUIRE(workers == std::vector<std::string>{"W2", "W2", "W1", "W3", "W1"});

    for (std::size_t i = 0; i < ids.size(); ++i) {
        REQUIRE(assignments[i].task->task_id == ids[i]);
        REQUIRE(f.supervisor->get_status(ids[i]) == TaskStatus::IN_PROGRESS);
    }
    REQUIRE(f.pool->find("W1")->current_task_count == 2);
    REQUIRE(f.pool->find("W2")->current_task_count == 2);
    REQUIRE(f.pool->find("W3")->current_task_count == 1);
}

TEST_CASE("Submission persists tasks and never waits for workers", "[supervisor]") {
    Fixture f;
    auto id = f.supervisor->submit_task(search_task());

    REQUIRE(id.rfind("task-", 0) == 0);
    REQUIRE(f.store->get_status(id) == TaskStatus::PENDING);
    REQUIRE(f.supervisor->queued_count() == 1);

    WorkerTask named = search_task();
    named.task_id = "explicit";
    REQUIRE(f.supervisor->submit_task(named) == "explicit");
}

TEST_CASE("Dispatch serves higher priority first, FIFO within a priority", "[supervisor]") {
    Fixture f;
    WorkerTask low = search_task(0);
    low.task_id = "low";
    WorkerTask high1 = search_task(5);
    high1.task_id = "high1";
    WorkerTask high2 = search_task(5);
    high2.task_id = "high2";
    f.supervisor->submit_tasks({low, high1, high2});

    auto assignments = f.supervisor->dispatch(LoadBalancingStrategy::ROUND_ROBIN);
    REQUIRE(assignments.size() == 3);
    REQUIRE(assignments[0].task->task_id == "high1");
    REQUIRE(assignments[1].task->task_id == "high2");
    REQUIRE(assignments[2].task->task_id == "low");
}

TEST_CASE("Dispatch stops when no worker has room", "[supervisor]") {
    Fixture f;
    std::vector<WorkerTask> tasks(8, search_task());
    f.supervisor->submit_tasks(tasks);

    REQUIRE(f.supervisor->dispatch().size() == 6);
    REQUIRE(f.supervisor->queued_count() == 2);

    auto stats = f.supervisor->statistics();
    REQUIRE(stats.pending == 2);
    REQUIRE(stats.in_progress == 6);
}

TEST_CASE("Completing a task stores the result and frees the worker", "[supervisor]") {
    Fixture f;
    f.supervisor->submit_tasks({search_task(), search_task()});
    auto assignments = f.supervisor->dispatch();
    REQUIRE(assignments.size() == 2);

    REQUIRE(f.supervisor->complete_task(result_for(assignments[0], true)));
    REQUIRE(f.supervisor->complete_task(result_for(assignments[1], false)));
    REQUIRE_FALSE(f.supervisor->complete_task(result_for(assignments[1], true)));

    const auto& failed_id = assignments[1].task->task_id;
    REQUIRE(f.supervisor->get_status(failed_id) == TaskStatus::FAILED);
    REQUIRE(f.supervisor->get_result(failed_id)->error_message.value() == "failed on W2");
    REQUIRE(f.pool->find("W2")->current_task_count == 0);

    auto stats = f.supervisor->statistics();
    REQUIRE(stats.completed == 1);
    REQUIRE(stats.failed == 1);
    REQUIRE(stats.average_execution_time == std::chrono::milliseconds(10));
    REQUIRE(stats.tasks_by_worker.at("W2") == 2);
    REQUIRE(stats.tasks_by_type.at("search") == 2);
}

TEST_CASE("Cancelled tasks are skipped and terminal tasks cannot be cancelled", "[supervisor]") {
    Fixture f;
    auto ids = f.supervisor->submit_tasks({search_task(), search_task()});

    REQUIRE(f.supervisor->cancel_task(ids[0]));
    REQUIRE_FALSE(f.supervisor->cancel_task(ids[0]));
    REQUIRE_FALSE(f.supervisor->cancel_task("unknown"));

    auto assignments = f.supervisor->dispatch();
    REQUIRE(assignments.size() == 1);
    REQUIRE(assignments[0].task->task_id == ids[1]);

    REQUIRE(f.supervisor->complete_task(result_for(assignments[0], true)));
    REQUIRE_FALSE(f.supervisor->cancel_task(ids[1]));
    REQUIRE(f.supervisor->statistics().cancelled == 1);
}

TEST_CASE("Cancelling an in-flight task releases its worker", "[supervisor]") {
    Fixture f;
    auto id = f.supervisor->submit_task(search_task());
    auto assignments = f.supervisor->dispatch();
    REQUIRE(f.pool->find("W2")->current_task_count == 1);

    REQUIRE(f.supervisor->cancel_task(id));
    REQUIRE(f.pool->find("W2")->current_task_count == 0);
    REQUIRE(f.supervisor->get_status(id) == TaskStatus::CANCELLED);
}

TEST_CASE("A preferred worker with room wins over the strategy", "[supervisor]") {
    Fixture f;
    WorkerTask task = search_task();
    task.preferred_worker_id = "W3";
    f.supervisor->submit_task(task);

    auto assignments = f.supervisor->dispatch();
    REQUIRE(assignments.at(0).worker_id == "W3");
}

TEST_CASE("Default strategy comes from the supervisor config", "[supervisor]") {
    SupervisorConfig config;
    config.default_strategy = LoadBalancingStrategy::ROUND_ROBIN;
    config.task_id_prefix = "job";
    Fixture f(config);

    auto ids = f.supervisor->submit_tasks({search_task(), search_task(), search_task()});
    REQUIRE(ids[0].rfind("job-", 0) == 0);

    std::vector<std::string> workers;
    for (const auto& a : f.supervisor->dispatch()) workers.push_back(a.worker_id);
    REQUIRE(workers == std::vector<std::string>{"W1", "W2", "W3"});
}

TEST_CASE("An id that is queued, in flight or finished cannot be submitted again", "[supervisor]") {
    Fixture f;
    WorkerTask dup = search_task();
    dup.task_id = "dup";
    f.supervisor->submit_task(dup);
    REQUIRE_THROWS_AS(f.supervisor->submit_task(dup), std::invalid_argument);

    auto first = f.supervisor->dispatch(LoadBalancingStrategy::ROUND_ROBIN);
    REQUIRE(first.size() == 1);
    const WorkerId owner = first[0].worker_id;

    REQUIRE_THROWS_AS(f.supervisor->submit_task(dup), std::invalid_argument);
    REQUIRE(f.supervisor->dispatch(LoadBalancingStrategy::ROUND_ROBIN).empty());
    REQUIRE(f.supervisor->get_status("dup") == TaskStatus::IN_PROGRESS);

    REQUIRE(f.supervisor->complete_task(result_for(first[0], true)));
    for (const auto& worker : f.pool->snapshot()) {
        REQUIRE(worker.current_task_count == 0);
    }
    REQUIRE(f.pool->find(owner)->current_task_count == 0);

    REQUIRE_THROWS_AS(f.supervisor->submit_task(dup), std::invalid_argument);
    REQUIRE(f.supervisor->get_status("dup") == TaskStatus::COMPLETED);
    REQUIRE(f.supervisor->statistics().total_submitted == 1);
}

TEST_CASE("A rejected batch enqueues nothing", "[supervisor]") {
    Fixture f;
    WorkerTask a = search_task();
    a.task_id = "a";
    WorkerTask b = search_task();
    b.task_id = "b";

    REQUIRE_THROWS_AS(f.supervisor->submit_tasks({a, b, a}), std::invalid_argument);
    REQUIRE(f.supervisor->queued_count() == 0);
    REQUIRE(f.store->get("a") == nullptr);

    REQUIRE(f.supervisor->submit_tasks({a, b}).size() == 2);
}

TEST_CASE("Round robin skips a full worker instead of stalling dispatch", "[supervisor]") {
    Fixture f;
    WorkerTask pinned = search_task();
    pinned.preferred_worker_id = "W1";
    f.supervisor->submit_tasks({pinned, pinned});
    REQUIRE(f.supervisor->dispatch(LoadBalancingStrategy::ROUND_ROBIN).size() == 2);
    REQUIRE(f.pool->find("W1")->current_task_count == 2);

    // Preferred picks bypass the balancer, so the cursor still starts at the full W1
    f.supervisor->submit_tasks({search_task(), search_task(), search_task()});
    auto assignments = f.supervisor->dispatch(LoadBalancingStrategy::ROUND_ROBIN);
    REQUIRE(assignments.size() == 3);
    for (const auto& a : assignments) {
        REQUIRE(a.worker_id != "W1");
    }
    REQUIRE(f.pool->available_count() == 1);
}

TEST_CASE("Worker pool load counters never go negative", "[supervisor][pool]") {
    WorkerPool pool;
    REQUIRE(pool.add_worker("W1", AgentCapabilities{}));
    REQUIRE_FALSE(pool.add_worker("W1", AgentCapabilities{}));

    REQUIRE(pool.decrement_load("W1"));
    REQUIRE(pool.find("W1")->current_task_count == 0);
    REQUIRE(pool.increment_load("W1"));
    REQUIRE(pool.available_count() == 0);
    REQUIRE_FALSE(pool.increment_load("ghost"));

    REQUIRE(pool.remove_worker("W1"));
    REQUIRE(pool.snapshot().empty());
}

TEST_CASE("A graph delegates work and loops until results are collected", "[supervisor][graph]") {
    Fixture f;

    GraphBuilder builder("delegation");
    builder
        .add_node("plan", make_delegate_handler(f.supervisor, [](const AgentState&) {
            return std::vector<WorkerTask>{search_task(), search_task(), search_task()};
        }))
        .add_node("work", [&f](const AgentState& s) {
            // Stand-in for external workers: finish one assigned task per visit
            for (const auto& a : f.supervisor->dispatch()) {
                (void)a;
            }
            auto in_progress = f.store->list(TaskStatus::IN_PROGRESS);
            if (!in_progress.empty()) {
                Assignment a{in_progress.front(), "W2"};
                f.supervisor->complete_task(result_for(a, in_progress.size() != 2));
            }
            return s;
        })
        .add_node("collect", make_collect_handler(f.supervisor, [](AgentState s, const TaskResultMap& results) {
            return s.with("seen_results", static_cast<int>(results.size()));
        }))
        .add_node("report", [](const AgentState& s) { return s; })
        .add_edge("plan", "work")
        .add_edge("work", "collect")
        .add_conditional_edge("collect", tasks_outstanding("work"), {"work"})
        .add_edge("collect", "report")
        .set_entry_point("plan")
        .add_exit_point("report");

    auto state = builder.compile()->invoke(AgentState{});

    REQUIRE(state.get(kPendingTaskIds).empty());
    REQUIRE(state.get(kCompletedTaskIds).size() == 2);
    REQUIRE(state.get(kFailedTaskIds).size() == 1);
    REQUIRE(state.get(kTaskResults).size() == 3);
    REQUIRE(state.get("seen_results") == 3);
    REQUIRE(f.supervisor->statistics().in_progress == 0);
}
