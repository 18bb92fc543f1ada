// graphflow/core/node.h
#ifndef GRAPHFLOW_CORE_NODE_H
#define GRAPHFLOW_CORE_NODE_H

#include "graphflow/common/types.h"
#include "graphflow/core/command.h"
#include <functional>
#include <memory>

namespace graphflow {

// 节点接口：读取当前状态，返回状态增量或 Command。
// process() may be called concurrently from distinct invocations and from Send
// fan-out, so implementations must not rely on unsynchronized mutable members.
class Node {
public:
    virtual ~Node() = default;
    [[nodiscard]] virtual NodeOutput process(const Context& state) const = 0;
};

// Adapts a callable returning Context, Command or NodeOutput.
class FunctionNode : public Node {
public:
    using Function = std::function<NodeOutput(const Context&)>;

    explicit FunctionNode(Function fn);
    [[nodiscard]] NodeOutput process(const Context& state) const override;

private:
    Function fn_;
};

} // namespace graphflow

#endif // GRAPHFLOW_CORE_NODE_H
