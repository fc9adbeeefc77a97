// core/types/event.cpp
#include "core/types/event.h"

namespace agentgraph {

const char* to_string(GraphEventType type) {
    switch (type) {
        case GraphEventType::NODE_STARTED:    return "node_started";
        case GraphEventType::NODE_COMPLETED:  return "node_completed";
        case GraphEventType::EDGE_TRAVERSED:  return "edge_traversed";
        case GraphEventType::ERROR:           return "error";
        case GraphEventType::GRAPH_COMPLETED: return "graph_completed";
    }
    return "unknown";
}

nlohmann::json event_to_json(const GraphEvent& event, bool include_state) {
    nlohmann::json j;
    j["type"] = to_string(event.type);
    j["node"] = event.node;
    j["step"] = event.step;
    j["execution_id"] = event.execution_id;
    j["duration_us"] = event.duration.count();
    if (event.target) {
        j["target"] = *event.target;
    }
    if (event.error) {
        j["error"] = *event.error;
    }
    if (include_state) {
        j["state"] = event.state;
    }
    return j;
}

} // namespace agentgraph
