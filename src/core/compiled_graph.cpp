// core/compiled_graph.cpp
#include "graphflow/core/compiled_graph.h"
#include "graphflow/common/errors.h"
#include "graphflow/common/logging.h"
#include "graphflow/common/utils.h"
#include "engine/execution_run.h"

namespace graphflow {

CompiledGraph::CompiledGraph(std::shared_ptr<const GraphDefinition> graph, std::shared_ptr<Checkpointer> checkpointer)
    : graph_(std::move(graph)), checkpointer_(std::move(checkpointer)) {
    if (!graph_) {
        throw std::invalid_argument("CompiledGraph requires a graph definition");
    }
}

GraphResult CompiledGraph::invoke(Context state) const {
    ExecutionRun run(graph_, checkpointer_, std::move(state), std::nullopt, StreamMode::VALUES, false);
    return run.run_to_end();
}

GraphResult CompiledGraph::invoke_with_config(Context state, const RunConfig& config) const {
    ExecutionRun run(graph_, checkpointer_, std::move(state), config, StreamMode::VALUES, false);
    return run.run_to_end();
}

GraphStream CompiledGraph::stream(Context state, StreamMode mode) const {
    return GraphStream(std::make_unique<ExecutionRun>(graph_, checkpointer_, std::move(state), std::nullopt, mode, true));
}

GraphStream CompiledGraph::stream_with_config(Context state, StreamMode mode, const RunConfig& config) const {
    return GraphStream(std::make_unique<ExecutionRun>(graph_, checkpointer_, std::move(state), config, mode, true));
}

Checkpointer& CompiledGraph::require_checkpointer() const {
    if (!checkpointer_) {
        throw CheckpointError("no checkpointer configured");
    }
    return *checkpointer_;
}

std::optional<Checkpoint> CompiledGraph::get_state(const RunConfig& config) const {
    return require_checkpointer().get(config.thread_id, config.checkpoint_id);
}

std::vector<Checkpoint> CompiledGraph::get_state_history(const RunConfig& config) const {
    return require_checkpointer().list(config.thread_id);
}

Checkpoint CompiledGraph::update_state(const RunConfig& config, const Context& update) const {
    Checkpointer& checkpointer = require_checkpointer();
    std::optional<Checkpoint> base = checkpointer.get(config.thread_id, config.checkpoint_id);
    if (!base) {
        throw CheckpointError("No checkpoint found for thread '" + config.thread_id + "'");
    }

    Checkpoint updated;
    updated.thread_id = config.thread_id;
    updated.checkpoint_id = generate_id("cp");
    updated.state = graph_->schema.merge(base->state, update);
    updated.next_node = base->next_node;
    updated.parent_id = base->checkpoint_id;
    updated.metadata = config.metadata.is_object() ? config.metadata : Value::object();
    updated.metadata["source"] = "update_state";
    updated.metadata["step"] = base->metadata.value("step", 0);
    updated.metadata["reason"] = "update_state";
    if (base->is_paused()) {
        updated.metadata["paused"] = base->pause_reason();
    } else {
        updated.metadata.erase("paused");
    }
    updated.timestamp = std::chrono::system_clock::now();
    checkpointer.put(updated);

    logger().debug("State of thread '" + config.thread_id + "' updated; next node '" + updated.next_node + "'");
    return checkpointer.get(config.thread_id, updated.checkpoint_id).value_or(updated);
}

CompiledGraph CompiledGraph::with_checkpointer(std::shared_ptr<Checkpointer> checkpointer) const {
    return CompiledGraph(graph_, std::move(checkpointer));
}

} // namespace graphflow
