// core/state_graph.cpp
#include "graphflow/core/state_graph.h"
#include "graphflow/common/errors.h"
#include "graphflow/common/logging.h"
#include <algorithm>
#include <set>

namespace graphflow {

namespace {

bool is_sentinel(const NodeName& name) {
    return name == START || name == END;
}

} // namespace

StateGraph& StateGraph::add_node(const NodeName& name, std::shared_ptr<Node> node) {
    if (nodes_.count(name) == 0) {
        node_order_.push_back(name);
    }
    nodes_[name] = std::move(node);
    return *this;
}

StateGraph& StateGraph::add_edge(const NodeName& source, const NodeName& target) {
    edges_.push_back(Edge{source, target});
    return *this;
}

StateGraph& StateGraph::add_conditional_edges(const NodeName& source, Router router,
                                              std::map<std::string, NodeName> path_map) {
    conditional_edges_.push_back(ConditionalEdge{source, std::move(router), std::move(path_map)});
    return *this;
}

StateGraph& StateGraph::set_entry_point(const NodeName& name) {
    entry_point_ = name;
    return *this;
}

StateGraph& StateGraph::interrupt_before(const std::vector<NodeName>& names) {
    interrupt_before_.insert(interrupt_before_.end(), names.begin(), names.end());
    return *this;
}

StateGraph& StateGraph::interrupt_after(const std::vector<NodeName>& names) {
    interrupt_after_.insert(interrupt_after_.end(), names.begin(), names.end());
    return *this;
}

std::optional<NodeName> StateGraph::start_edge_target() const {
    for (const auto& edge : edges_) {
        if (edge.source == START) {
            return edge.target;
        }
    }
    return std::nullopt;
}

bool StateGraph::has_conditional_start() const {
    return std::any_of(conditional_edges_.begin(), conditional_edges_.end(),
                       [](const ConditionalEdge& e) { return e.source == START; });
}

std::vector<std::string> StateGraph::validate() const {
    std::vector<std::string> violations;
    auto is_node = [this](const NodeName& name) { return nodes_.count(name) > 0 && !is_sentinel(name); };

    // Node names
    for (const auto& name : node_order_) {
        if (name.empty()) {
            violations.push_back("node name must not be empty");
        } else if (is_sentinel(name)) {
            violations.push_back("'" + name + "' is reserved and cannot be registered as a node");
        } else if (!nodes_.at(name)) {
            violations.push_back("node '" + name + "' has no implementation");
        }
    }

    // Entry point
    std::optional<NodeName> start_target = start_edge_target();
    bool conditional_start = has_conditional_start();
    if (!entry_point_ && !start_target && !conditional_start) {
        violations.push_back("no entry point: call set_entry_point() or add_edge(START, node)");
    }
    if (entry_point_ && !is_node(*entry_point_)) {
        violations.push_back("entry point '" + *entry_point_ + "' is not a registered node");
    }
    if (entry_point_ && start_target && *start_target != *entry_point_) {
        violations.push_back("edge START -> '" + *start_target + "' conflicts with entry point '" + *entry_point_ + "'");
    }
    for (const auto& edge : edges_) {
        if (edge.source == START && start_target && edge.target != *start_target) {
            violations.push_back("edge START -> '" + edge.target + "' conflicts with edge START -> '" + *start_target + "'");
        }
    }
    if (entry_point_ && conditional_start) {
        violations.push_back("conditional edge from START conflicts with entry point '" + *entry_point_ + "'");
    }

    // Fixed edges
    std::map<NodeName, size_t> fixed_count;
    for (const auto& edge : edges_) {
        if (edge.source == END) {
            violations.push_back("edge source cannot be END (edge to '" + edge.target + "')");
        } else if (edge.source != START && !is_node(edge.source)) {
            violations.push_back("edge source '" + edge.source + "' is not a registered node");
        }
        if (edge.target == START) {
            violations.push_back("edge target cannot be START (edge from '" + edge.source + "')");
        } else if (edge.target != END && !is_node(edge.target)) {
            violations.push_back("edge target '" + edge.target + "' (from '" + edge.source + "') is not a registered node");
        }
        ++fixed_count[edge.source];
    }

    // Conditional edges
    std::map<NodeName, size_t> conditional_count;
    for (const auto& edge : conditional_edges_) {
        if (edge.source == END) {
            violations.push_back("conditional edge source cannot be END");
        } else if (edge.source != START && !is_node(edge.source)) {
            violations.push_back("conditional edge source '" + edge.source + "' is not a registered node");
        }
        if (!edge.router) {
            violations.push_back("conditional edge from '" + edge.source + "' has no router");
        }
        for (const auto& [label, target] : edge.path_map) {
            if (target != END && !is_node(target)) {
                violations.push_back("path map of '" + edge.source + "' routes '" + label +
                                     "' to unknown node '" + target + "'");
            }
        }
        ++conditional_count[edge.source];
    }

    for (const auto& [source, count] : conditional_count) {
        if (count > 1) {
            violations.push_back("node '" + source + "' has " + std::to_string(count) +
                                 " conditional edges; at most one is allowed");
        }
        if (fixed_count.count(source) > 0) {
            violations.push_back("node '" + source + "' mixes conditional and fixed edges");
        }
    }

    // Interrupts
    for (const auto& name : interrupt_before_) {
        if (!is_node(name)) {
            violations.push_back("interrupt_before names unknown node '" + name + "'");
        }
    }
    for (const auto& name : interrupt_after_) {
        if (!is_node(name)) {
            violations.push_back("interrupt_after names unknown node '" + name + "'");
        }
    }

    return violations;
}

CompiledGraph StateGraph::compile(std::shared_ptr<Checkpointer> checkpointer) const {
    std::vector<std::string> violations = validate();
    if (!violations.empty()) {
        throw CompileError(std::move(violations));
    }

    auto graph = std::make_shared<GraphDefinition>();
    graph->schema = schema_;
    graph->nodes = nodes_;
    graph->node_order = node_order_;
    graph->edges = edges_;
    graph->conditional_edges = conditional_edges_;
    graph->interrupt_before = std::set<NodeName>(interrupt_before_.begin(), interrupt_before_.end());
    graph->interrupt_after = std::set<NodeName>(interrupt_after_.begin(), interrupt_after_.end());

    if (entry_point_) {
        graph->entry_point = *entry_point_;
    } else if (auto start_target = start_edge_target()) {
        graph->entry_point = *start_target;
    }

    for (size_t i = 0; i < graph->edges.size(); ++i) {
        const Edge& edge = graph->edges[i];
        auto [it, inserted] = graph->first_edge_index.emplace(edge.source, i);
        if (!inserted && edge.source != START) {
            logger().warning("Node '" + edge.source + "' has several fixed edges; only '" +
                             graph->edges[it->second].target + "' will be followed");
        }
    }
    for (size_t i = 0; i < graph->conditional_edges.size(); ++i) {
        graph->conditional_index.emplace(graph->conditional_edges[i].source, i);
    }

    return CompiledGraph(std::move(graph), std::move(checkpointer));
}

} // namespace graphflow
