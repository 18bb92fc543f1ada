// graphflow/core/graph_definition.h
#ifndef GRAPHFLOW_CORE_GRAPH_DEFINITION_H
#define GRAPHFLOW_CORE_GRAPH_DEFINITION_H

#include "graphflow/common/types.h"
#include "graphflow/core/edge.h"
#include "graphflow/core/node.h"
#include "graphflow/core/state.h"
#include <memory>
#include <set>
#include <unordered_map>
#include <vector>

namespace graphflow {

// Frozen output of StateGraph::compile(). Shared read-only by every
// invocation of a CompiledGraph.
struct GraphDefinition {
    StateSchema schema;
    std::unordered_map<NodeName, std::shared_ptr<Node>> nodes;
    std::vector<NodeName> node_order;               // registration order
    std::vector<Edge> edges;
    std::vector<ConditionalEdge> conditional_edges;
    NodeName entry_point;                           // empty when a conditional START edge picks it
    std::set<NodeName> interrupt_before;
    std::set<NodeName> interrupt_after;

    std::unordered_map<NodeName, size_t> first_edge_index;
    std::unordered_map<NodeName, size_t> conditional_index;

    bool has_node(const NodeName& name) const { return nodes.count(name) > 0; }
    const Node* find_node(const NodeName& name) const;

    // Throws RoutingError unless `target` is END or a registered node.
    void validate_target(const NodeName& target, const std::string& origin) const;

    // 条件边优先，其次第一条固定边，否则 END
    NodeName resolve_next(const NodeName& source, const Context& state) const;

    NodeName resolve_entry(const Context& state) const;

private:
    NodeName apply_router(const ConditionalEdge& edge, const Context& state) const;
};

} // namespace graphflow

#endif // GRAPHFLOW_CORE_GRAPH_DEFINITION_H
