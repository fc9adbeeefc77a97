// modules/graph/graph_definition.cpp
#include "modules/graph/graph_definition.h"
#include <deque>
#include <unordered_set>

namespace agentgraph {

namespace {

bool is_known_target(const GraphDefinition& def, const NodeName& target) {
    return target == kEndNode || def.has_node(target);
}

} // namespace

const NodeHandler* GraphDefinition::find_handler(const NodeName& node) const {
    auto it = nodes.find(node);
    return it != nodes.end() ? &it->second : nullptr;
}

std::optional<EdgeDecision> GraphDefinition::route(const NodeName& from, const AgentState& state) const {
    if (auto decision = route_by_edges(from, state)) {
        return decision;
    }
    if (is_exit_point(from)) {
        return EdgeDecision::end();
    }
    return std::nullopt;
}

std::optional<EdgeDecision> GraphDefinition::route_by_edges(const NodeName& from, const AgentState& state) const {
    auto cond_it = conditional_edges.find(from);
    if (cond_it != conditional_edges.end()) {
        for (const auto& edge : cond_it->second) {
            if (auto decision = edge.condition(state)) {
                return decision;
            }
        }
    }

    auto static_it = static_edges.find(from);
    if (static_it != static_edges.end() && !static_it->second.empty()) {
        return EdgeDecision::to(static_it->second.front());
    }
    return std::nullopt;
}

std::vector<std::string> GraphDefinition::validate() const {
    std::vector<std::string> violations;

    bool entry_ok = false;
    if (!entry_point.has_value()) {
        violations.push_back("Graph must have an entry point");
    } else if (!has_node(*entry_point)) {
        violations.push_back("Entry point '" + *entry_point + "' does not exist");
    } else {
        entry_ok = true;
    }

    for (const auto& exit : exit_points) {
        if (!has_node(exit)) {
            violations.push_back("Exit point '" + exit + "' does not exist");
        }
    }

    for (const auto& from : node_order) {
        auto it = static_edges.find(from);
        if (it != static_edges.end() && it->second.size() > 1) {
            violations.push_back("Node '" + from + "' has " + std::to_string(it->second.size()) +
                                 " static edges; at most one is allowed");
        }
    }
    for (const auto& [from, targets] : static_edges) {
        if (!has_node(from)) {
            violations.push_back("Static edge source '" + from + "' does not exist");
        }
        for (const auto& to : targets) {
            if (!is_known_target(*this, to)) {
                violations.push_back("Static edge '" + from + "' -> '" + to + "' references unknown node '" + to + "'");
            }
        }
    }

    for (const auto& [from, edges] : conditional_edges) {
        if (!has_node(from)) {
            violations.push_back("Conditional edge source '" + from + "' does not exist");
        }
        for (const auto& edge : edges) {
            if (!edge.condition) {
                violations.push_back("Conditional edge from '" + from + "' has no condition");
            }
            for (const auto& to : edge.declared_targets) {
                if (!is_known_target(*this, to)) {
                    violations.push_back("Conditional edge from '" + from + "' declares unknown target '" + to + "'");
                }
            }
        }
    }

    if (entry_ok) {
        // BFS over static edges and declared conditional targets. A conditional edge without
        // declared targets is opaque and may route to END.
        std::unordered_set<NodeName> visited;
        std::deque<NodeName> queue{*entry_point};
        bool can_terminate = false;

        while (!queue.empty() && !can_terminate) {
            NodeName current = queue.front();
            queue.pop_front();
            if (!visited.insert(current).second) continue;

            if (is_exit_point(current)) {
                can_terminate = true;
                break;
            }

            std::vector<NodeName> next;
            if (auto it = static_edges.find(current); it != static_edges.end()) {
                next.insert(next.end(), it->second.begin(), it->second.end());
            }
            if (auto it = conditional_edges.find(current); it != conditional_edges.end()) {
                for (const auto& edge : it->second) {
                    if (edge.declared_targets.empty()) {
                        can_terminate = true;
                    }
                    next.insert(next.end(), edge.declared_targets.begin(), edge.declared_targets.end());
                }
            }
            for (const auto& n : next) {
                if (n == kEndNode) {
                    can_terminate = true;
                } else if (has_node(n) && !visited.count(n)) {
                    queue.push_back(n);
                }
            }
        }

        if (!can_terminate) {
            violations.push_back("No path from entry point '" + *entry_point +
                                 "' reaches an exit point or " + std::string(kEndNode));
        }
    }

    return violations;
}

} // namespace agentgraph
