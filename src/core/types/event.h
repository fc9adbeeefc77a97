#ifndef AGENTGRAPH_TYPES_EVENT_H
#define AGENTGRAPH_TYPES_EVENT_H

#include "context.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace agentgraph {

enum class GraphEventType : uint8_t {
    NODE_STARTED,
    NODE_COMPLETED,
    EDGE_TRAVERSED,
    ERROR,
    GRAPH_COMPLETED
};

const char* to_string(GraphEventType type);

// One observable transition. Per step: NODE_STARTED -> (NODE_COMPLETED | ERROR) -> EDGE_TRAVERSED,
// and GRAPH_COMPLETED last on a successful run.
struct GraphEvent {
    GraphEventType type = GraphEventType::NODE_STARTED;
    NodeName node;                         // node the event belongs to
    std::optional<NodeName> target;        // EDGE_TRAVERSED only; may be kEndNode
    AgentState state;                      // snapshot at the time of the event
    std::chrono::microseconds duration{0}; // handler time for NODE_COMPLETED / ERROR
    std::optional<std::string> error;
    int step = 0;
    std::string execution_id;
};

nlohmann::json event_to_json(const GraphEvent& event, bool include_state = false);

} // namespace agentgraph

#endif // AGENTGRAPH_TYPES_EVENT_H
