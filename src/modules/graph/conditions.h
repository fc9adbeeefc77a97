// modules/graph/conditions.h
#ifndef AGENTGRAPH_MODULES_GRAPH_CONDITIONS_H
#define AGENTGRAPH_MODULES_GRAPH_CONDITIONS_H

#include "modules/graph/graph_definition.h"
#include <nlohmann/json.hpp>
#include <string>

namespace agentgraph {

// Data an expression is rendered against:
//   values, messages, last_message (null without messages), current_node, step
nlohmann::json condition_view(const AgentState& state);

// Routes to target when the Inja expression renders true, e.g.
//   when("values.intent == \"search\"", "search")
EdgeCondition when(std::string expression, NodeName target);

// Renders the template to a node name. An empty rendering yields no decision,
// "__end__" terminates. e.g. route_by("{{ values.next }}")
EdgeCondition route_by(std::string template_str);

// Always fires; register it last as the fallback
EdgeCondition otherwise(NodeName target);

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_GRAPH_CONDITIONS_H
