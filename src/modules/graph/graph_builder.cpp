// modules/graph/graph_builder.cpp
#include "modules/graph/graph_builder.h"
#include "core/engine.h"
#include "core/types/errors.h"
#include "common/logging/logger.h"
#include <stdexcept>

namespace agentgraph {

GraphBuilder::GraphBuilder(std::string name) {
    definition_.name = std::move(name);
}

GraphBuilder& GraphBuilder::add_node_handler(const NodeName& name, NodeHandler handler) {
    if (name.empty()) {
        throw std::invalid_argument("Node name cannot be empty");
    }
    if (name == kEndNode) {
        throw std::invalid_argument(std::string("'") + kEndNode + "' is reserved");
    }
    if (!handler) {
        throw std::invalid_argument("Node '" + name + "' has no handler");
    }
    if (definition_.has_node(name)) {
        throw DuplicateNodeError(name);
    }
    definition_.nodes.emplace(name, std::move(handler));
    definition_.node_order.push_back(name);
    return *this;
}

void GraphBuilder::require_node(const NodeName& name, const char* role) const {
    if (!definition_.has_node(name)) {
        throw NodeNotFoundError(name, std::string(role) + " node '" + name + "' does not exist in graph '" +
                                          definition_.name + "'");
    }
}

GraphBuilder& GraphBuilder::add_edge(const NodeName& from, const NodeName& to) {
    require_node(from, "Source");
    if (to != kEndNode) {
        require_node(to, "Target");
    }
    definition_.static_edges[from].push_back(to);
    return *this;
}

GraphBuilder& GraphBuilder::add_conditional_edge(const NodeName& from, EdgeCondition condition,
                                                 std::vector<NodeName> declared_targets) {
    require_node(from, "Source");
    if (!condition) {
        throw std::invalid_argument("Conditional edge from '" + from + "' has no condition");
    }
    definition_.conditional_edges[from].push_back(
        ConditionalEdge{from, std::move(condition), std::move(declared_targets)});
    return *this;
}

GraphBuilder& GraphBuilder::set_entry_point(const NodeName& name) {
    require_node(name, "Entry");
    definition_.entry_point = name;
    return *this;
}

GraphBuilder& GraphBuilder::add_exit_point(const NodeName& name) {
    require_node(name, "Exit");
    definition_.exit_points.insert(name);
    return *this;
}

std::shared_ptr<const CompiledGraph> GraphBuilder::compile(std::shared_ptr<CheckpointStore> checkpoint_store) const {
    auto violations = definition_.validate();
    if (!violations.empty()) {
        logger()->warn("Graph '{}' failed validation with {} violation(s)", definition_.name, violations.size());
        throw GraphValidationError(std::move(violations));
    }

    logger()->debug("Compiled graph '{}' ({} nodes, entry '{}')",
                    definition_.name, definition_.nodes.size(), *definition_.entry_point);
    // 拷贝定义：编译后的图与 builder 互不影响
    return std::make_shared<const CompiledGraph>(definition_, std::move(checkpoint_store));
}

} // namespace agentgraph
