// graphflow/core/compiled_graph.h
#ifndef GRAPHFLOW_CORE_COMPILED_GRAPH_H
#define GRAPHFLOW_CORE_COMPILED_GRAPH_H

#include "graphflow/checkpoint/checkpoint.h"
#include "graphflow/core/graph_definition.h"
#include "graphflow/engine/graph_result.h"
#include "graphflow/engine/graph_stream.h"
#include <memory>
#include <optional>
#include <vector>

namespace graphflow {

// 编译后的不可变图。Cheap to copy; copies share the frozen definition and the
// checkpointer, and every invocation owns its own state and iteration counter.
class CompiledGraph {
public:
    CompiledGraph(std::shared_ptr<const GraphDefinition> graph, std::shared_ptr<Checkpointer> checkpointer);

    [[nodiscard]] GraphResult invoke(Context state = Context::object()) const;

    // With a checkpointer: resumes the thread's latest (or config.checkpoint_id)
    // checkpoint when one exists; the input state is then ignored unless the
    // thread already finished.
    [[nodiscard]] GraphResult invoke_with_config(Context state, const RunConfig& config) const;

    [[nodiscard]] GraphStream stream(Context state, StreamMode mode = StreamMode::VALUES) const;
    [[nodiscard]] GraphStream stream_with_config(Context state, StreamMode mode, const RunConfig& config) const;

    // Checkpoint addressed by config (latest when no checkpoint_id).
    // Throws CheckpointError when no checkpointer is configured.
    std::optional<Checkpoint> get_state(const RunConfig& config) const;
    std::vector<Checkpoint> get_state_history(const RunConfig& config) const;

    // Merges `update` into the addressed checkpoint and writes a new checkpoint
    // with the same next node. Returns the new checkpoint.
    Checkpoint update_state(const RunConfig& config, const Context& update) const;

    [[nodiscard]] CompiledGraph with_checkpointer(std::shared_ptr<Checkpointer> checkpointer) const;
    const std::shared_ptr<Checkpointer>& checkpointer() const { return checkpointer_; }

    // Introspection
    const std::vector<NodeName>& nodes() const { return graph_->node_order; }
    const NodeName& entry_point() const { return graph_->entry_point; }
    const std::vector<Edge>& edges() const { return graph_->edges; }
    const std::vector<ConditionalEdge>& conditional_edges() const { return graph_->conditional_edges; }
    const std::set<NodeName>& interrupt_before_nodes() const { return graph_->interrupt_before; }
    const std::set<NodeName>& interrupt_after_nodes() const { return graph_->interrupt_after; }
    const StateSchema& schema() const { return graph_->schema; }
    const std::shared_ptr<const GraphDefinition>& definition() const { return graph_; }

private:
    std::shared_ptr<const GraphDefinition> graph_;
    std::shared_ptr<Checkpointer> checkpointer_;

    Checkpointer& require_checkpointer() const;
};

} // namespace graphflow

#endif // GRAPHFLOW_CORE_COMPILED_GRAPH_H
