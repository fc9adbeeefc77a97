// tests/test_conditions.cpp
#include <catch2/catch_test_macros.hpp>
#include "common/utils/template_renderer.h"
#include "modules/graph/conditions.h"

using namespace agentgraph;

namespace {

AgentState sample_state() {
    AgentState s;
    s.messages.push_back(Message{"user", "hello"});
    s.values["intent"] = "search";
    s.values["score"] = 0.75;
    s.values["next"] = "respond";
    s.current_node = "classify";
    s.step = 2;
    return s;
}

} // namespace

TEST_CASE("when() fires only if the expression is true", "[conditions]") {
    auto state = sample_state();

    auto decision = when("values.intent == \"search\"", "search")(state);
    REQUIRE(decision.has_value());
    REQUIRE(decision->target == "search");

    REQUIRE_FALSE(when("values.score > 0.9", "escalate")(state).has_value());
    REQUIRE(when("values.score > 0.5 and step == 2", "ok")(state).has_value());
    REQUIRE(when("last_message.role == \"user\"", "reply")(state).has_value());
}

TEST_CASE("when() rejects expressions that are not boolean", "[conditions]") {
    REQUIRE_THROWS(when("values.intent", "x")(sample_state()));
}

TEST_CASE("route_by() renders the target name", "[conditions]") {
    auto state = sample_state();
    REQUIRE(route_by("{{ values.next }}")(state)->target == "respond");

    state.values["next"] = "";
    REQUIRE_FALSE(route_by("{{ values.next }}")(state).has_value());

    state.values["next"] = kEndNode;
    REQUIRE(route_by("{{ values.next }}")(state)->is_end());
}

TEST_CASE("otherwise() always decides", "[conditions]") {
    REQUIRE(otherwise("fallback")(AgentState{})->target == "fallback");
}

TEST_CASE("Template includes are disabled", "[conditions]") {
    REQUIRE_THROWS(InjaTemplateRenderer::render("{% include \"/etc/passwd\" %}", nlohmann::json::object()));
}

TEST_CASE("Condition view exposes the state fields", "[conditions]") {
    auto view = condition_view(sample_state());
    REQUIRE(view["values"]["intent"] == "search");
    REQUIRE(view["current_node"] == "classify");
    REQUIRE(view["last_message"]["content"] == "hello");
    REQUIRE(condition_view(AgentState{})["last_message"].is_null());
}
