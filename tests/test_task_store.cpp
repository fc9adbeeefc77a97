// tests/test_task_store.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/errors.h"
#include "modules/delegation/task_store.h"

#include <thread>
#include <vector>

using namespace agentgraph;

namespace {

std::shared_ptr<const WorkerTask> make_task(const std::string& id, const std::string& type = "search") {
    auto task = std::make_shared<WorkerTask>();
    task->task_id = id;
    task->task_type = type;
    return task;
}

std::shared_ptr<const WorkerTaskResult> make_result(const std::string& id, bool success) {
    auto result = std::make_shared<WorkerTaskResult>();
    result->task_id = id;
    result->success = success;
    result->worker_id = "W1";
    if (success) {
        result->output = {{"answer", 42}};
    } else {
        result->error_message = "worker crashed";
    }
    return result;
}

} // namespace

TEST_CASE("Saved tasks start pending", "[task_store]") {
    InMemoryTaskStore store;
    store.save(make_task("t1"));

    REQUIRE(store.get("t1")->task_type == "search");
    REQUIRE(store.get_status("t1") == TaskStatus::PENDING);
    REQUIRE(store.get("missing") == nullptr);
    REQUIRE_FALSE(store.get_status("missing").has_value());
    REQUIRE(store.get_result("t1") == nullptr);
}

TEST_CASE("Broken arguments raise TaskStoreError", "[task_store]") {
    InMemoryTaskStore store;
    REQUIRE_THROWS_AS(store.save(nullptr), TaskStoreError);
    REQUIRE_THROWS_AS(store.save(make_task("")), TaskStoreError);
    REQUIRE_THROWS_AS(store.save_result(nullptr), TaskStoreError);
}

TEST_CASE("Saving again replaces the task and resets its status", "[task_store]") {
    InMemoryTaskStore store;
    store.save(make_task("t1", "search"));
    REQUIRE(store.update_status("t1", TaskStatus::IN_PROGRESS));

    store.save(make_task("t1", "summarize"));
    REQUIRE(store.get("t1")->task_type == "summarize");
    REQUIRE(store.get_status("t1") == TaskStatus::PENDING);
    REQUIRE(store.size() == 1);
}

TEST_CASE("Saving a finished task again keeps its status and result", "[task_store]") {
    InMemoryTaskStore store;
    store.save(make_task("t1", "search"));
    store.save_result(make_result("t1", true));

    store.save(make_task("t1", "summarize"));
    REQUIRE(store.get("t1")->task_type == "summarize");
    REQUIRE(store.get_status("t1") == TaskStatus::COMPLETED);
    REQUIRE(store.get_result("t1")->output == nlohmann::json{{"answer", 42}});
    REQUIRE(store.list(TaskStatus::PENDING).empty());

    store.save(make_task("t2"));
    REQUIRE(store.update_status("t2", TaskStatus::CANCELLED));
    store.save(make_task("t2"));
    REQUIRE(store.get_status("t2") == TaskStatus::CANCELLED);
}

TEST_CASE("A failed result is stored with status FAILED", "[task_store]") {
    InMemoryTaskStore store;
    store.save(make_task("t1"));
    REQUIRE(store.update_status("t1", TaskStatus::IN_PROGRESS));

    auto result = make_result("t1", false);
    store.save_result(result);

    auto loaded = store.get_result("t1");
    REQUIRE(*loaded == *result);
    REQUIRE(loaded->error_message.value() == "worker crashed");
    REQUIRE(store.get_status("t1") == TaskStatus::FAILED);
}

TEST_CASE("Terminal tasks refuse further status changes", "[task_store]") {
    InMemoryTaskStore store;
    store.save(make_task("done"));
    store.save_result(make_result("done", true));
    REQUIRE(store.get_status("done") == TaskStatus::COMPLETED);
    REQUIRE_FALSE(store.update_status("done", TaskStatus::IN_PROGRESS));

    store.save(make_task("stopped"));
    REQUIRE(store.update_status("stopped", TaskStatus::CANCELLED));
    REQUIRE_FALSE(store.update_status("stopped", TaskStatus::PENDING));

    REQUIRE_FALSE(store.update_status("missing", TaskStatus::IN_PROGRESS));
}

TEST_CASE("Blocked and review are holding states", "[task_store]") {
    InMemoryTaskStore store;
    store.save(make_task("t1"));
    REQUIRE(store.update_status("t1", TaskStatus::BLOCKED));
    REQUIRE(store.update_status("t1", TaskStatus::REVIEW));
    REQUIRE(store.update_status("t1", TaskStatus::IN_PROGRESS));
    REQUIRE(store.get_status("t1") == TaskStatus::IN_PROGRESS);
}

TEST_CASE("List filters by status in submission order", "[task_store]") {
    InMemoryTaskStore store;
    for (const char* id : {"a", "b", "c", "d"}) {
        store.save(make_task(id));
    }
    REQUIRE(store.update_status("b", TaskStatus::IN_PROGRESS));
    store.save_result(make_result("d", true));

    auto pending = store.list(TaskStatus::PENDING);
    REQUIRE(pending.size() == 2);
    REQUIRE(pending[0]->task_id == "a");
    REQUIRE(pending[1]->task_id == "c");
    REQUIRE(store.list(TaskStatus::COMPLETED).size() == 1);
}

TEST_CASE("Concurrent writers and readers leave a consistent store", "[task_store][concurrency]") {
    InMemoryTaskStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < 50; ++i) {
                const std::string id = "t" + std::to_string(t) + "-" + std::to_string(i);
                store.save(make_task(id));
                store.save_result(make_result(id, i % 2 == 0));
                (void)store.get_status(id);
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(store.size() == 200);
    REQUIRE(store.list(TaskStatus::COMPLETED).size() == 100);
    REQUIRE(store.list(TaskStatus::FAILED).size() == 100);
}
