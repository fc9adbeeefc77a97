// modules/graph/graph_definition.h
#ifndef AGENTGRAPH_MODULES_GRAPH_GRAPH_DEFINITION_H
#define AGENTGRAPH_MODULES_GRAPH_GRAPH_DEFINITION_H

#include "core/types/context.h"
#include "core/types/cancellation.h"
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgraph {

// Routing outcome of a conditional edge: a node name or the end sentinel
struct EdgeDecision {
    NodeName target;

    static EdgeDecision to(NodeName node) { return EdgeDecision{std::move(node)}; }
    static EdgeDecision end() { return EdgeDecision{kEndNode}; }

    bool is_end() const { return target == kEndNode; }
    bool operator==(const EdgeDecision&) const = default;
};

using NodeHandler = std::function<AgentState(const AgentState&, const CancellationToken&)>;
using EdgeCondition = std::function<std::optional<EdgeDecision>(const AgentState&)>;

struct ConditionalEdge {
    NodeName from;
    EdgeCondition condition;
    std::vector<NodeName> declared_targets; // optional, only used by validate()
};

// Immutable once owned by a CompiledGraph
struct GraphDefinition {
    std::string name = "graph";
    std::unordered_map<NodeName, NodeHandler> nodes;
    std::vector<NodeName> node_order;                                   // registration order
    std::unordered_map<NodeName, std::vector<NodeName>> static_edges;   // from -> targets
    std::unordered_map<NodeName, std::vector<ConditionalEdge>> conditional_edges; // ordered per source
    std::optional<NodeName> entry_point;
    std::set<NodeName> exit_points;

    bool has_node(const NodeName& node) const { return nodes.count(node) > 0; }
    bool is_exit_point(const NodeName& node) const { return exit_points.count(node) > 0; }
    const NodeHandler* find_handler(const NodeName& node) const;

    // Conditional edges in registration order (first decision wins), then the static edge,
    // then END for exit points. std::nullopt means the node has nowhere to go.
    std::optional<EdgeDecision> route(const NodeName& from, const AgentState& state) const;

    // route() without the exit point fallback
    std::optional<EdgeDecision> route_by_edges(const NodeName& from, const AgentState& state) const;

    // Every structural defect, empty when the graph is sound
    std::vector<std::string> validate() const;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_GRAPH_GRAPH_DEFINITION_H
