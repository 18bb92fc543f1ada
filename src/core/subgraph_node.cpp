// core/subgraph_node.cpp
#include "graphflow/core/subgraph_node.h"

namespace graphflow {

NodeOutput SubgraphNode::process(const Context& state) const {
    GraphResult result = graph_.invoke(state);
    Context delta = graph_.schema().diff(state, result.state);

    if (result.is_interrupted()) {
        Value payload = result.interrupt_value.value_or(Value{{"next_node", result.next_node.value_or(END)}});
        return Command::interrupt_with_update(std::move(payload), std::move(delta));
    }
    return delta;
}

} // namespace graphflow
