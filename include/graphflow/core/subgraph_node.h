// graphflow/core/subgraph_node.h
#ifndef GRAPHFLOW_CORE_SUBGRAPH_NODE_H
#define GRAPHFLOW_CORE_SUBGRAPH_NODE_H

#include "graphflow/core/compiled_graph.h"
#include "graphflow/core/node.h"

namespace graphflow {

// Runs an independently compiled graph as a single node. The sub-graph starts
// from the parent's state; what it adds (per its own schema) becomes this
// node's update. A sub-graph interrupt surfaces as an interrupt of this node.
class SubgraphNode : public Node {
public:
    explicit SubgraphNode(CompiledGraph graph) : graph_(std::move(graph)) {}

    [[nodiscard]] NodeOutput process(const Context& state) const override;

    const CompiledGraph& graph() const { return graph_; }

private:
    CompiledGraph graph_;
};

} // namespace graphflow

#endif // GRAPHFLOW_CORE_SUBGRAPH_NODE_H
