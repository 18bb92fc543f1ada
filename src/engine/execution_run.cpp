// engine/execution_run.cpp
#include "engine/execution_run.h"
#include "graphflow/common/errors.h"
#include "graphflow/common/logging.h"
#include "graphflow/common/utils.h"
#include <future>

namespace graphflow {

namespace {

std::optional<Checkpoint> load_checkpoint(Checkpointer& checkpointer, const RunConfig& config) {
    try {
        return checkpointer.get(config.thread_id, config.checkpoint_id);
    } catch (const GraphError&) {
        throw;
    } catch (const std::exception& e) {
        throw CheckpointError("Checkpointer get failed for thread '" + config.thread_id + "': " + e.what());
    }
}

} // namespace

ExecutionRun::ExecutionRun(std::shared_ptr<const GraphDefinition> graph,
                           std::shared_ptr<Checkpointer> checkpointer,
                           Context input,
                           std::optional<RunConfig> config,
                           StreamMode mode,
                           bool emit_events)
    : graph_(std::move(graph)),
      checkpointer_(std::move(checkpointer)),
      config_(std::move(config)),
      mode_(mode),
      emit_events_(emit_events),
      input_(input.is_null() ? Context::object() : std::move(input)),
      trace_(config_ ? config_->thread_id : generate_id("t")) {}

std::optional<GraphEvent> ExecutionRun::next() {
    while (pending_.empty() && !finished_) {
        step();
    }
    if (pending_.empty()) {
        return std::nullopt;
    }
    GraphEvent event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

GraphResult ExecutionRun::run_to_end() {
    while (!finished_) {
        step();
    }
    return result_;
}

void ExecutionRun::start() {
    started_ = true;
    state_ = input_;

    std::optional<Checkpoint> checkpoint;
    if (checkpointing()) {
        checkpoint = load_checkpoint(*checkpointer_, *config_);
        if (config_->checkpoint_id && !checkpoint) {
            throw CheckpointError("Checkpoint '" + *config_->checkpoint_id + "' not found for thread '" +
                                  config_->thread_id + "'");
        }
    } else if (config_ && config_->checkpoint_id) {
        throw CheckpointError("no checkpointer configured");
    }

    if (checkpoint) {
        last_checkpoint_id_ = checkpoint->checkpoint_id;
        if (checkpoint->is_terminal()) {
            state_ = graph_->schema.merge(checkpoint->state, input_);
            current_ = graph_->resolve_entry(state_);
            return;
        }

        // 恢复执行：忽略输入状态，从检查点的下一个节点继续
        state_ = checkpoint->state;
        current_ = checkpoint->next_node;
        if (current_ == END) {
            // Paused after the last node: nothing left to run. Record the finish so
            // the next invocation on this thread starts over.
            logger().debug("Resuming thread '" + config_->thread_id + "' past its last node");
            NodeName source = checkpoint->metadata.is_object() ? checkpoint->metadata.value("source", std::string(END)) : END;
            save_checkpoint(source, END, "loop");
            return;
        }
        if (!graph_->has_node(current_)) {
            throw RoutingError("Checkpoint '" + checkpoint->checkpoint_id + "' resumes at unknown node '" +
                               current_ + "'");
        }
        // Only a pause taken in front of this node has already passed its interrupt_before.
        skip_interrupt_before_ = checkpoint->pause_reason() == "interrupt_before";
        logger().debug("Resuming thread '" + config_->thread_id + "' at '" + current_ + "'");
        return;
    }
    current_ = graph_->resolve_entry(state_);
}

void ExecutionRun::step() {
    if (!started_) {
        start();
    }
    if (current_ == END) {
        finish(GraphStatus::COMPLETE, std::nullopt, std::nullopt);
        return;
    }

    if (!guard_.try_consume_node()) {
        logger().error("Iteration limit reached before '" + current_ + "'");
        throw IterationLimitExceeded(guard_.limit());
    }

    if (graph_->interrupt_before.count(current_) > 0 && !skip_interrupt_before_) {
        save_checkpoint(current_, current_, "interrupt_before");
        finish(GraphStatus::INTERRUPTED, current_, std::nullopt);
        return;
    }
    skip_interrupt_before_ = false;

    const NodeName node_name = current_;
    const Node* node = graph_->find_node(node_name);
    size_t record = trace_.on_node_start(node_name, guard_.used());

    NodeOutput output;
    try {
        output = node->process(state_);
    } catch (const std::exception& e) {
        trace_.on_node_end(record, "failed", std::string(e.what()), Context());
        throw NodeError(node_name, e.what());
    }

    Context delta = output.delta();
    try {
        state_ = graph_->schema.merge(state_, delta);
    } catch (const GraphError& e) {
        trace_.on_node_end(record, "failed", std::string(e.what()), delta);
        throw;
    }

    const Command* command = output.is_command() ? &output.command() : nullptr;
    bool interrupted = command && command->kind == Command::Kind::INTERRUPT;
    trace_.on_node_end(record, interrupted ? "interrupted" : "success", std::nullopt, delta);
    emit(node_name, delta);

    NodeName next;
    std::optional<Value> send_interrupt;
    if (!command) {
        next = graph_->resolve_next(node_name, state_);
    } else {
        switch (command->kind) {
            case Command::Kind::GOTO:
                if (!command->target || command->target->empty()) {
                    throw RoutingError("Goto command from '" + node_name + "' has no target");
                }
                graph_->validate_target(*command->target, "Command from '" + node_name + "'");
                next = *command->target;
                break;
            case Command::Kind::END:
                next = END;
                break;
            case Command::Kind::SEND:
                send_interrupt = run_sends(node_name, command->sends);
                next = graph_->resolve_next(node_name, state_);
                break;
            case Command::Kind::UPDATE:
            case Command::Kind::INTERRUPT:
                next = graph_->resolve_next(node_name, state_);
                break;
        }
    }

    if (interrupted) {
        save_checkpoint(node_name, next, "interrupt");
        finish(GraphStatus::INTERRUPTED, next, command->interrupt_value);
        return;
    }
    if (send_interrupt) {
        save_checkpoint(node_name, next, "interrupt");
        finish(GraphStatus::INTERRUPTED, next, std::move(send_interrupt));
        return;
    }
    if (graph_->interrupt_after.count(node_name) > 0) {
        save_checkpoint(node_name, next, "interrupt_after");
        finish(GraphStatus::INTERRUPTED, next, std::nullopt);
        return;
    }
    save_checkpoint(node_name, next, "loop");
    current_ = next;
}

std::optional<Value> ExecutionRun::run_sends(const NodeName& issuer, const std::vector<Send>& sends) {
    std::vector<const Node*> targets;
    targets.reserve(sends.size());
    for (const auto& send : sends) {
        const Node* target = graph_->find_node(send.node);
        if (!target) {
            throw RoutingError("Send from '" + issuer + "' targets unknown node '" + send.node + "'");
        }
        targets.push_back(target);
    }

    std::vector<size_t> records;
    std::vector<std::future<NodeOutput>> futures;
    records.reserve(sends.size());
    futures.reserve(sends.size());
    for (size_t i = 0; i < sends.size(); ++i) {
        records.push_back(trace_.on_node_start(sends[i].node, guard_.used(), true));
        Context input = sends[i].state ? *sends[i].state : state_;
        const Node* target = targets[i];
        futures.push_back(std::async(std::launch::async, [target, input = std::move(input)]() {
            return target->process(input);
        }));
    }

    // Join every target before reporting the first failure.
    std::vector<NodeOutput> outputs(sends.size());
    std::vector<bool> joined(sends.size(), false);
    std::optional<NodeError> failure;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            outputs[i] = futures[i].get();
            joined[i] = true;
        } catch (const std::exception& e) {
            trace_.on_node_end(records[i], "failed", std::string(e.what()), Context());
            if (!failure) {
                failure.emplace(sends[i].node, e.what());
            }
        }
    }
    if (failure) {
        for (size_t i = 0; i < outputs.size(); ++i) {
            if (joined[i]) {
                trace_.on_node_end(records[i], "success", std::nullopt, outputs[i].delta());
            }
        }
        throw *failure;
    }

    // 按注册顺序合并；第一个中断的目标决定中断内容
    std::optional<Value> interrupt_value;
    for (size_t i = 0; i < outputs.size(); ++i) {
        const NodeOutput& output = outputs[i];
        const Command* command = output.is_command() ? &output.command() : nullptr;
        bool interrupted = command && command->kind == Command::Kind::INTERRUPT;
        if (interrupted && !interrupt_value) {
            interrupt_value = command->interrupt_value;
        } else if (command && !interrupted && command->kind != Command::Kind::UPDATE) {
            logger().warning("Send target '" + sends[i].node + "' returned a routing command; only its update is applied");
        }
        Context delta = output.delta();
        state_ = graph_->schema.merge(state_, delta);
        trace_.on_node_end(records[i], interrupted ? "interrupted" : "success", std::nullopt, delta);
        emit(sends[i].node, delta);
    }
    return interrupt_value;
}

void ExecutionRun::emit(const NodeName& node, const Context& delta) {
    if (!emit_events_) {
        return;
    }
    if (mode_ == StreamMode::VALUES) {
        pending_.push_back(GraphEvent{node, state_});
    } else {
        pending_.push_back(GraphEvent{node, delta.is_null() ? Context::object() : delta});
    }
}

void ExecutionRun::save_checkpoint(const NodeName& source, const NodeName& next, const std::string& reason) {
    if (!checkpointing()) {
        return;
    }

    Checkpoint checkpoint;
    checkpoint.thread_id = config_->thread_id;
    checkpoint.checkpoint_id = generate_id("cp");
    checkpoint.state = state_;
    checkpoint.next_node = next;
    checkpoint.parent_id = last_checkpoint_id_;
    checkpoint.metadata = config_->metadata.is_object() ? config_->metadata : Value::object();
    checkpoint.metadata["source"] = source;
    checkpoint.metadata["step"] = guard_.used();
    checkpoint.metadata["reason"] = reason;
    checkpoint.metadata.erase("paused");
    checkpoint.timestamp = std::chrono::system_clock::now();

    try {
        checkpointer_->put(checkpoint);
    } catch (const GraphError&) {
        throw;
    } catch (const std::exception& e) {
        throw CheckpointError("Checkpointer put failed for thread '" + checkpoint.thread_id + "': " + e.what());
    }
    last_checkpoint_id_ = checkpoint.checkpoint_id;
}

void ExecutionRun::finish(GraphStatus status, std::optional<NodeName> next, std::optional<Value> interrupt_value) {
    finished_ = true;
    result_.status = status;
    result_.state = state_;
    result_.next_node = std::move(next);
    result_.interrupt_value = std::move(interrupt_value);
    result_.traces = trace_.get_traces();

    if (status == GraphStatus::INTERRUPTED) {
        logger().info("Graph interrupted; next node '" + result_.next_node.value_or(END) + "'");
    } else {
        logger().debug("Graph completed after " + std::to_string(guard_.used()) + " node(s)");
    }
}

} // namespace graphflow
