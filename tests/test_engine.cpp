// tests/test_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/engine.h"
#include "modules/graph/graph_builder.h"
#include "modules/graph/conditions.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace agentgraph;

namespace {

std::shared_ptr<const CompiledGraph> make_classify_graph() {
    GraphBuilder builder("classify");
    builder.add_node("start", [](const AgentState& s) { return s.with("started", true); })
           .add_node("classify", [](const AgentState& s) {
               const bool search = s.messages.front().content.find("find") != std::string::npos;
               return s.with("intent", search ? "search" : "chat");
           })
           .add_node("search", [](const AgentState& s) { return s.with("searched", true); })
           .add_node("respond", [](const AgentState& s) { return s.with_message("assistant", "done"); })
           .add_edge("start", "classify")
           .add_conditional_edge("classify", when("values.intent == \"search\"", "search"), {"search"})
           .add_conditional_edge("classify", otherwise("respond"), {"respond"})
           .add_edge("search", "respond")
           .set_entry_point("start")
           .add_exit_point("respond");
    return builder.compile();
}

AgentState user_says(const std::string& text) {
    AgentState s;
    s.messages.push_back(Message{"user", text});
    return s;
}

// a -> a forever
std::shared_ptr<const CompiledGraph> make_loop_graph(std::atomic<int>& calls,
                                                     std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    GraphBuilder builder("loop");
    builder.add_node("tick", [&calls, delay](const AgentState& s) {
               ++calls;
               if (delay.count() > 0) std::this_thread::sleep_for(delay);
               return s.with("ticks", calls.load());
           })
           .add_node("stop", [](const AgentState& s) { return s; })
           .add_conditional_edge("tick", [](const AgentState&) {
               return std::optional<EdgeDecision>(EdgeDecision::to("tick"));
           }, {"tick", "stop"})
           .set_entry_point("tick")
           .add_exit_point("stop");
    return builder.compile();
}

} // namespace

TEST_CASE("start, classify, respond: three nodes ending at respond", "[engine]") {
    std::atomic<int> executions{0};
    GraphBuilder builder("known_intent");
    builder.add_node("start", [&](const AgentState& s) { ++executions; return s; })
           .add_node("classify", [&](const AgentState& s) { ++executions; return s.with("intent", "known"); })
           .add_node("respond", [&](const AgentState& s) { ++executions; return s.with_message("assistant", "ok"); })
           .add_edge("start", "classify")
           .add_conditional_edge("classify", [](const AgentState& s) {
               return s.get("intent") == "known" ? EdgeDecision::to("respond") : EdgeDecision::end();
           }, {"respond", kEndNode})
           .set_entry_point("start")
           .add_exit_point("respond");

    auto state = builder.compile()->invoke(AgentState{});
    REQUIRE(executions == 3);
    REQUIRE(state.current_node == "respond");
    REQUIRE(state.step == 3);
}

TEST_CASE("Classify scenario routes a search request through the search branch", "[engine]") {
    auto graph = make_classify_graph();

    auto state = graph->invoke(user_says("please find the docs"));
    REQUIRE(state.get("intent") == "search");
    REQUIRE(state.get("searched") == true);
    REQUIRE(state.current_node == "respond");
    REQUIRE(state.step == 4);
    REQUIRE(state.messages.back() == Message{"assistant", "done"});
}

TEST_CASE("Classify scenario skips the search branch for chat", "[engine]") {
    auto result = make_classify_graph()->run(user_says("hello there"));

    REQUIRE(result.success());
    REQUIRE(result.failure == FailureKind::NONE);
    REQUIRE_FALSE(result.final_state.has("searched"));
    REQUIRE(result.final_state.step == 3);
    REQUIRE(result.traces.size() == 3);
    REQUIRE(result.traces[1].node == "classify");
    REQUIRE(result.traces[1].values_delta["intent"] == "chat");
    REQUIRE_FALSE(result.execution_id.empty());
}

TEST_CASE("A run never executes more than max_steps nodes", "[engine][budget]") {
    std::atomic<int> calls{0};
    auto graph = make_loop_graph(calls);

    GraphExecutionOptions options;
    options.max_steps = 5;

    try {
        graph->invoke(AgentState{}, options);
        FAIL("expected MaxStepsExceededError");
    } catch (const MaxStepsExceededError& e) {
        REQUIRE(e.max_steps() == 5);
        REQUIRE(e.kind() == FailureKind::MAX_STEPS);
        REQUIRE(e.last_state().step == 5);
        REQUIRE(e.last_state().get("ticks") == 5);
    }
    REQUIRE(calls == 5);
}

TEST_CASE("run() reports a step budget failure with the last good state", "[engine][budget]") {
    std::atomic<int> calls{0};
    GraphExecutionOptions options;
    options.max_steps = 3;

    auto result = make_loop_graph(calls)->run(AgentState{}, options);
    REQUIRE(result.status == RunStatus::FAILED);
    REQUIRE(result.failure == FailureKind::MAX_STEPS);
    REQUIRE(result.final_state.step == 3);
    REQUIRE(result.traces.size() == 3);
}

TEST_CASE("Non-positive max_steps is rejected before anything runs", "[engine][budget]") {
    std::atomic<int> calls{0};
    GraphExecutionOptions options;
    options.max_steps = 0;

    REQUIRE_THROWS_AS(make_loop_graph(calls)->invoke(AgentState{}, options), std::invalid_argument);
    REQUIRE(calls == 0);
}

TEST_CASE("The wall-clock timeout is checked between nodes", "[engine][budget]") {
    std::atomic<int> calls{0};
    auto graph = make_loop_graph(calls, std::chrono::milliseconds(20));

    GraphExecutionOptions options;
    options.timeout = std::chrono::milliseconds(30);

    REQUIRE_THROWS_AS(graph->invoke(AgentState{}, options), TimeoutExceededError);
    REQUIRE(calls >= 2);
    REQUIRE(calls < 100);
}

TEST_CASE("Handler exceptions surface as NodeHandlerError with the cause", "[engine][errors]") {
    GraphBuilder builder;
    builder.add_node("ok", [](const AgentState& s) { return s.with("ok", true); })
           .add_node("boom", [](const AgentState&) -> AgentState { throw std::out_of_range("index 9"); })
           .add_edge("ok", "boom")
           .set_entry_point("ok")
           .add_exit_point("boom");
    auto graph = builder.compile();

    try {
        graph->invoke(AgentState{});
        FAIL("expected NodeHandlerError");
    } catch (const NodeHandlerError& e) {
        REQUIRE(e.node() == "boom");
        REQUIRE(e.cause_message() == "index 9");
        REQUIRE(e.last_state().get("ok") == true);
        REQUIRE(e.last_state().current_node == "ok");
        REQUIRE_THROWS_AS(e.rethrow_cause(), std::out_of_range);
    }

    auto result = graph->run(AgentState{});
    REQUIRE(result.failure == FailureKind::HANDLER_FAILURE);
    REQUIRE(result.traces.back().status == "failed");
    REQUIRE(result.traces.back().error.value() == "index 9");
}

TEST_CASE("The first conditional edge that decides wins", "[engine][routing]") {
    GraphBuilder builder;
    builder.add_node("router", [](const AgentState& s) { return s; })
           .add_node("first", [](const AgentState& s) { return s.with("picked", "first"); })
           .add_node("second", [](const AgentState& s) { return s.with("picked", "second"); })
           .add_node("static", [](const AgentState& s) { return s.with("picked", "static"); })
           .add_conditional_edge("router", [](const AgentState&) { return std::optional<EdgeDecision>{}; })
           .add_conditional_edge("router", otherwise("first"), {"first"})
           .add_conditional_edge("router", otherwise("second"), {"second"})
           .add_edge("router", "static")
           .set_entry_point("router")
           .add_exit_point("first")
           .add_exit_point("second")
           .add_exit_point("static");

    REQUIRE(builder.compile()->invoke(AgentState{}).get("picked") == "first");
}

TEST_CASE("The static edge applies when no condition decides", "[engine][routing]") {
    GraphBuilder builder;
    builder.add_node("router", [](const AgentState& s) { return s; })
           .add_node("static", [](const AgentState& s) { return s.with("picked", "static"); })
           .add_conditional_edge("router", [](const AgentState&) { return std::optional<EdgeDecision>{}; })
           .add_edge("router", "static")
           .set_entry_point("router")
           .add_exit_point("static");

    REQUIRE(builder.compile()->invoke(AgentState{}).get("picked") == "static");
}

TEST_CASE("Routing to an undeclared node fails with NodeNotFoundError", "[engine][routing]") {
    GraphBuilder builder;
    builder.add_node("a", [](const AgentState& s) { return s.with("a", 1); })
           .add_conditional_edge("a", route_by("ghost"))
           .set_entry_point("a");

    try {
        builder.compile()->invoke(AgentState{});
        FAIL("expected NodeNotFoundError");
    } catch (const NodeNotFoundError& e) {
        REQUIRE(e.node() == "ghost");
        REQUIRE(e.last_state().get("a") == 1);
    }
}

TEST_CASE("A non-exit node without a route fails", "[engine][routing]") {
    GraphBuilder builder;
    builder.add_node("a", [](const AgentState& s) { return s; })
           .add_node("b", [](const AgentState& s) { return s; })
           .add_conditional_edge("a", [](const AgentState&) { return std::optional<EdgeDecision>{}; }, {"b"})
           .add_edge("b", kEndNode)
           .set_entry_point("a");

    auto result = builder.compile()->run(AgentState{});
    REQUIRE(result.status == RunStatus::FAILED);
    REQUIRE(result.failure == FailureKind::NODE_NOT_FOUND);
}

TEST_CASE("Cancellation stops the run at the next step boundary", "[engine][cancel]") {
    CancellationSource source;
    std::atomic<int> calls{0};

    GraphBuilder builder;
    builder.add_node("work", [&](const AgentState& s) {
               if (++calls == 2) source.cancel();
               return s.with("calls", calls.load());
           })
           .add_node("done", [](const AgentState& s) { return s; })
           .add_conditional_edge("work", otherwise("work"), {"work", "done"})
           .set_entry_point("work")
           .add_exit_point("done");
    auto graph = builder.compile();

    GraphExecutionOptions options;
    options.cancellation = source.token();

    try {
        graph->invoke(AgentState{}, options);
        FAIL("expected ExecutionCancelledError");
    } catch (const ExecutionCancelledError& e) {
        REQUIRE(e.last_state().get("calls") == 2);
    }
    REQUIRE(calls == 2);

    calls = 0;
    CancellationSource again;
    options.cancellation = again.token();
    again.cancel();
    auto result = graph->run(AgentState{}, options);
    REQUIRE(result.status == RunStatus::CANCELLED);
    REQUIRE(calls == 0);
}

TEST_CASE("Handlers replace the state and the engine stamps position fields", "[engine]") {
    GraphBuilder builder;
    builder.add_node("reset", [](const AgentState&) {
               AgentState fresh;
               fresh.values["only"] = "this";
               fresh.current_node = "bogus";
               fresh.step = 99;
               return fresh;
           })
           .set_entry_point("reset")
           .add_exit_point("reset");

    AgentState initial;
    initial.values["old"] = 1;
    auto state = builder.compile()->invoke(initial);
    REQUIRE_FALSE(state.has("old"));
    REQUIRE(state.get("only") == "this");
    REQUIRE(state.current_node == "reset");
    REQUIRE(state.step == 1);
}

TEST_CASE("One compiled graph serves concurrent runs", "[engine][concurrency]") {
    auto graph = make_classify_graph();
    std::vector<std::thread> threads;
    std::atomic<int> searches{0};

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto state = graph->invoke(user_says(i % 2 == 0 ? "find it" : "hi"));
            if (state.has("searched")) ++searches;
        });
    }
    for (auto& t : threads) t.join();
    REQUIRE(searches == 4);
}
