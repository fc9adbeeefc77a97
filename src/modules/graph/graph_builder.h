// modules/graph/graph_builder.h
#ifndef AGENTGRAPH_MODULES_GRAPH_GRAPH_BUILDER_H
#define AGENTGRAPH_MODULES_GRAPH_GRAPH_BUILDER_H

#include "modules/graph/graph_definition.h"
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace agentgraph {

class CompiledGraph;
class CheckpointStore;

// Assembles a GraphDefinition. compile() snapshots it, so later mutations of the
// builder never reach graphs that were already compiled.
class GraphBuilder {
public:
    explicit GraphBuilder(std::string name = "graph");

    // Accepts (const AgentState&, const CancellationToken&) or (const AgentState&)
    template <typename Func>
    GraphBuilder& add_node(const NodeName& name, Func&& func) {
        if constexpr (std::is_invocable_r_v<AgentState, Func, const AgentState&, const CancellationToken&>) {
            return add_node_handler(name, NodeHandler(std::forward<Func>(func)));
        } else {
            static_assert(std::is_invocable_r_v<AgentState, Func, const AgentState&>,
                          "node handler must take the state (and optionally a CancellationToken) and return AgentState");
            return add_node_handler(
                name,
                [f = std::forward<Func>(func)](const AgentState& state, const CancellationToken&) {
                    return f(state);
                });
        }
    }

    GraphBuilder& add_edge(const NodeName& from, const NodeName& to);

    // Evaluated in registration order; the first edge that returns a decision wins.
    GraphBuilder& add_conditional_edge(const NodeName& from, EdgeCondition condition,
                                       std::vector<NodeName> declared_targets = {});

    GraphBuilder& set_entry_point(const NodeName& name);
    GraphBuilder& add_exit_point(const NodeName& name);

    bool has_node(const NodeName& name) const { return definition_.has_node(name); }
    const GraphDefinition& definition() const { return definition_; }

    // Throws GraphValidationError listing every defect
    std::shared_ptr<const CompiledGraph> compile(std::shared_ptr<CheckpointStore> checkpoint_store = nullptr) const;

private:
    GraphBuilder& add_node_handler(const NodeName& name, NodeHandler handler);
    void require_node(const NodeName& name, const char* role) const;

    GraphDefinition definition_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_GRAPH_GRAPH_BUILDER_H
