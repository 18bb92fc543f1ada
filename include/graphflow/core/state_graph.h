// graphflow/core/state_graph.h
#ifndef GRAPHFLOW_CORE_STATE_GRAPH_H
#define GRAPHFLOW_CORE_STATE_GRAPH_H

#include "graphflow/checkpoint/checkpoint.h"
#include "graphflow/core/compiled_graph.h"
#include "graphflow/core/edge.h"
#include "graphflow/core/node.h"
#include "graphflow/core/state.h"
#include <concepts>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace graphflow {

// 图构建器：累积节点、边、入口与中断声明；compile() 校验并冻结。
//
//   StateGraph graph(message_state_schema());
//   graph.add_node("agent", agent)
//        .add_node("tools", tools)
//        .set_entry_point("agent")
//        .add_conditional_edges("agent", route, {{"tools", "tools"}, {"done", END}})
//        .add_edge("tools", "agent");
//   CompiledGraph app = graph.compile(std::make_shared<MemoryCheckpointer>());
class StateGraph {
public:
    StateGraph() = default;
    explicit StateGraph(StateSchema schema) : schema_(std::move(schema)) {}

    // Re-registering a name replaces the previous node.
    StateGraph& add_node(const NodeName& name, std::shared_ptr<Node> node);

    template<typename Func>
        requires std::invocable<Func, const Context&>
    StateGraph& add_node(const NodeName& name, Func&& fn) {
        return add_node(name, std::make_shared<FunctionNode>(std::forward<Func>(fn)));
    }

    // add_edge(START, x) sets the entry point.
    StateGraph& add_edge(const NodeName& source, const NodeName& target);
    StateGraph& add_conditional_edges(const NodeName& source, Router router,
                                      std::map<std::string, NodeName> path_map = {});
    StateGraph& set_entry_point(const NodeName& name);
    StateGraph& interrupt_before(const std::vector<NodeName>& names);
    StateGraph& interrupt_after(const std::vector<NodeName>& names);

    // Throws CompileError listing every violation found.
    [[nodiscard]] CompiledGraph compile(std::shared_ptr<Checkpointer> checkpointer = nullptr) const;

    // Every violation compile() would report, in a stable order.
    std::vector<std::string> validate() const;

    const StateSchema& schema() const { return schema_; }

private:
    StateSchema schema_;
    std::unordered_map<NodeName, std::shared_ptr<Node>> nodes_;
    std::vector<NodeName> node_order_;
    std::vector<Edge> edges_;
    std::vector<ConditionalEdge> conditional_edges_;
    std::optional<NodeName> entry_point_;
    std::vector<NodeName> interrupt_before_;
    std::vector<NodeName> interrupt_after_;

    std::optional<NodeName> start_edge_target() const;
    bool has_conditional_start() const;
};

} // namespace graphflow

#endif // GRAPHFLOW_CORE_STATE_GRAPH_H
