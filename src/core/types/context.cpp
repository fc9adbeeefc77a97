// core/types/context.cpp
#include "core/types/context.h"
#include <stdexcept>

namespace agentgraph {

const Value& AgentState::get(const std::string& key) const {
    static const Value null_value = nullptr;
    auto it = values.find(key);
    return it != values.end() ? it->second : null_value;
}

void to_json(nlohmann::json& j, const Message& message) {
    j = nlohmann::json{{"role", message.role}, {"content", message.content}};
}

void from_json(const nlohmann::json& j, Message& message) {
    j.at("role").get_to(message.role);
    j.at("content").get_to(message.content);
}

void to_json(nlohmann::json& j, const AgentState& state) {
    nlohmann::json values = nlohmann::json::object();
    for (const auto& [key, value] : state.values) {
        values[key] = value;
    }
    j = nlohmann::json{
        {"messages", state.messages},
        {"values", std::move(values)},
        {"current_node", state.current_node},
        {"step", state.step}
    };
}

void from_json(const nlohmann::json& j, AgentState& state) {
    state = AgentState{};
    if (j.contains("messages")) {
        j.at("messages").get_to(state.messages);
    }
    if (j.contains("values")) {
        const auto& values = j.at("values");
        if (!values.is_object()) {
            throw std::invalid_argument("AgentState 'values' must be an object");
        }
        for (auto it = values.begin(); it != values.end(); ++it) {
            state.values[it.key()] = it.value();
        }
    }
    if (j.contains("current_node") && j.at("current_node").is_string()) {
        state.current_node = j.at("current_node").get<std::string>();
    }
    if (j.contains("step")) {
        state.step = j.at("step").get<int>();
    }
}

} // namespace agentgraph
