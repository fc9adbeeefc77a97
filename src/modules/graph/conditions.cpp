// modules/graph/conditions.cpp
#include "modules/graph/conditions.h"
#include "common/utils/template_renderer.h"
#include <algorithm>
#include <cctype>

namespace agentgraph {

namespace {

std::string trim(const std::string& s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

nlohmann::json condition_view(const AgentState& state) {
    nlohmann::json view = state;
    view["last_message"] = state.messages.empty() ? nlohmann::json(nullptr) : nlohmann::json(state.messages.back());
    return view;
}

EdgeCondition when(std::string expression, NodeName target) {
    return [expression = std::move(expression), target = std::move(target)](const AgentState& state)
               -> std::optional<EdgeDecision> {
        if (InjaTemplateRenderer::evaluate(expression, condition_view(state))) {
            return EdgeDecision::to(target);
        }
        return std::nullopt;
    };
}

EdgeCondition route_by(std::string template_str) {
    return [template_str = std::move(template_str)](const AgentState& state) -> std::optional<EdgeDecision> {
        std::string target = trim(InjaTemplateRenderer::render(template_str, condition_view(state)));
        if (target.empty()) {
            return std::nullopt;
        }
        return EdgeDecision::to(std::move(target));
    };
}

EdgeCondition otherwise(NodeName target) {
    return [target = std::move(target)](const AgentState&) -> std::optional<EdgeDecision> {
        return EdgeDecision::to(target);
    };
}

} // namespace agentgraph
