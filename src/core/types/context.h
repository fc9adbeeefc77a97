#ifndef AGENTGRAPH_TYPES_CONTEXT_H
#define AGENTGRAPH_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace agentgraph {

// 使用 nlohmann::json 作为统一的数据类型
// Anything stored in AgentState::values must be JSON-representable so it survives a checkpoint.
using Value = nlohmann::json;
using ValueMap = std::map<std::string, Value>;

using NodeName = std::string;

// Sentinel target meaning "terminate the run"
inline constexpr const char* kEndNode = "__end__";

struct Message {
    std::string role;    // "system", "user", "assistant", "tool"
    std::string content;

    bool operator==(const Message&) const = default;
};

// AgentState is threaded through every node. Handlers return a complete replacement;
// the engine only owns current_node and step.
struct AgentState {
    std::vector<Message> messages;
    ValueMap values;
    NodeName current_node;
    int step = 0;

    bool operator==(const AgentState&) const = default;

    bool has(const std::string& key) const { return values.count(key) > 0; }

    const Value& get(const std::string& key) const;

    // Returns a copy with `key` set, for handlers that only touch one field
    [[nodiscard]] AgentState with(const std::string& key, Value value) const {
        AgentState next = *this;
        next.values[key] = std::move(value);
        return next;
    }

    [[nodiscard]] AgentState with_message(std::string role, std::string content) const {
        AgentState next = *this;
        next.messages.push_back(Message{std::move(role), std::move(content)});
        return next;
    }
};

void to_json(nlohmann::json& j, const Message& message);
void from_json(const nlohmann::json& j, Message& message);
void to_json(nlohmann::json& j, const AgentState& state);
void from_json(const nlohmann::json& j, AgentState& state);

} // namespace agentgraph

#endif // AGENTGRAPH_TYPES_CONTEXT_H
