// core/graph_definition.cpp
#include "graphflow/core/graph_definition.h"
#include "graphflow/common/errors.h"

namespace graphflow {

const Node* GraphDefinition::find_node(const NodeName& name) const {
    auto it = nodes.find(name);
    return it != nodes.end() ? it->second.get() : nullptr;
}

void GraphDefinition::validate_target(const NodeName& target, const std::string& origin) const {
    if (target == END || has_node(target)) {
        return;
    }
    throw RoutingError(origin + " routed to unknown node '" + target + "'");
}

NodeName GraphDefinition::resolve_next(const NodeName& source, const Context& state) const {
    if (auto it = conditional_index.find(source); it != conditional_index.end()) {
        return apply_router(conditional_edges[it->second], state);
    }
    if (auto it = first_edge_index.find(source); it != first_edge_index.end()) {
        return edges[it->second].target;
    }
    return END;
}

NodeName GraphDefinition::resolve_entry(const Context& state) const {
    if (!entry_point.empty()) {
        return entry_point;
    }
    return resolve_next(START, state);
}

NodeName GraphDefinition::apply_router(const ConditionalEdge& edge, const Context& state) const {
    std::string label;
    try {
        label = edge.router(state);
    } catch (const std::exception& e) {
        throw RoutingError("Router on '" + edge.source + "' failed: " + e.what());
    }

    NodeName target = label;
    if (!edge.path_map.empty()) {
        auto it = edge.path_map.find(label);
        if (it == edge.path_map.end()) {
            throw RoutingError("Router on '" + edge.source + "' returned label '" + label + "' missing from its path map");
        }
        target = it->second;
    }
    validate_target(target, "Router on '" + edge.source + "'");
    return target;
}

} // namespace graphflow
