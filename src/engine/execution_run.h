// engine/execution_run.h
#ifndef GRAPHFLOW_ENGINE_EXECUTION_RUN_H
#define GRAPHFLOW_ENGINE_EXECUTION_RUN_H

#include "graphflow/checkpoint/checkpoint.h"
#include "graphflow/core/graph_definition.h"
#include "graphflow/engine/graph_result.h"
#include "graphflow/engine/iteration_guard.h"
#include "graphflow/engine/trace_exporter.h"
#include <deque>
#include <memory>
#include <optional>
#include <vector>

namespace graphflow {

// One invocation of a compiled graph, advanced one node at a time.
// invoke() drains it; GraphStream pulls events from it.
class ExecutionRun {
public:
    ExecutionRun(std::shared_ptr<const GraphDefinition> graph,
                 std::shared_ptr<Checkpointer> checkpointer,
                 Context input,
                 std::optional<RunConfig> config,
                 StreamMode mode,
                 bool emit_events);

    // Runs nodes until an event is available or the run ends.
    std::optional<GraphEvent> next();

    // Runs to completion, discarding events.
    GraphResult run_to_end();

    bool finished() const { return finished_; }
    bool exhausted() const { return finished_ && pending_.empty(); }
    const GraphResult& result() const { return result_; }
    const std::vector<TraceRecord>& traces() const { return trace_.get_traces(); }

private:
    std::shared_ptr<const GraphDefinition> graph_;
    std::shared_ptr<Checkpointer> checkpointer_;
    std::optional<RunConfig> config_;
    StreamMode mode_;
    bool emit_events_;

    Context input_;
    Context state_;
    NodeName current_;
    std::optional<CheckpointId> last_checkpoint_id_;
    bool started_ = false;
    bool finished_ = false;
    bool skip_interrupt_before_ = false;

    IterationGuard guard_;
    TraceExporter trace_;
    std::deque<GraphEvent> pending_;
    GraphResult result_;

    void start();
    void step();

    // Applies a fan-out; returns after every target has joined. The result is the
    // payload of the first target (in registration order) that interrupted.
    std::optional<Value> run_sends(const NodeName& issuer, const std::vector<Send>& sends);

    void emit(const NodeName& node, const Context& delta);
    void save_checkpoint(const NodeName& source, const NodeName& next, const std::string& reason);
    void finish(GraphStatus status, std::optional<NodeName> next, std::optional<Value> interrupt_value);
    bool checkpointing() const { return checkpointer_ && config_.has_value(); }
};

} // namespace graphflow

#endif // GRAPHFLOW_ENGINE_EXECUTION_RUN_H
