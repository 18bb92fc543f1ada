// graphflow/agents/tool_node.h
#ifndef GRAPHFLOW_AGENTS_TOOL_NODE_H
#define GRAPHFLOW_AGENTS_TOOL_NODE_H

#include "graphflow/agents/message.h"
#include "graphflow/core/node.h"
#include "graphflow/tools/registry.h"
#include <memory>

namespace graphflow {

// Executes every tool call of the last message and appends one tool message
// per call, in call order.
class ToolNode : public Node {
public:
    explicit ToolNode(std::shared_ptr<const ToolRegistry> registry);

    [[nodiscard]] NodeOutput process(const Context& state) const override;

    Value execute(const ToolCall& call) const;

private:
    std::shared_ptr<const ToolRegistry> registry_;
};

} // namespace graphflow

#endif // GRAPHFLOW_AGENTS_TOOL_NODE_H
