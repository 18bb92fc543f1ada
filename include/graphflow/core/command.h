// graphflow/core/command.h
#ifndef GRAPHFLOW_CORE_COMMAND_H
#define GRAPHFLOW_CORE_COMMAND_H

#include "graphflow/common/types.h"
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace graphflow {

// One fan-out target. Without a payload the target receives the current state.
struct Send {
    NodeName node;
    std::optional<Context> state;

    explicit Send(NodeName node_name) : node(std::move(node_name)) {}
    Send(NodeName node_name, Context payload) : node(std::move(node_name)), state(std::move(payload)) {}
};

// 节点返回的控制指令
struct Command {
    enum class Kind : uint8_t {
        GOTO,      // jump to `target`, routers bypassed
        END,       // terminate the run
        UPDATE,    // merge `delta`, then ordinary edge resolution
        SEND,      // run `sends` concurrently, then ordinary edge resolution
        INTERRUPT  // checkpoint and pause with `interrupt_value`
    };

    Kind kind = Kind::UPDATE;
    std::optional<NodeName> target;
    std::optional<Context> delta;
    std::vector<Send> sends;
    Value interrupt_value;

    static Command go_to(NodeName target);
    static Command go_to_with_update(NodeName target, Context update);
    static Command end();
    static Command end_with_update(Context update);
    static Command update(Context update);
    static Command send(std::vector<Send> targets);
    static Command interrupt(Value payload);
    static Command interrupt_with_update(Value payload, Context update);
};

// A node's outcome: a plain state update or a Command.
class NodeOutput {
public:
    NodeOutput() : value_(Context::object()) {}
    NodeOutput(Context update) : value_(std::move(update)) {}
    NodeOutput(Command command) : value_(std::move(command)) {}

    bool is_command() const { return std::holds_alternative<Command>(value_); }
    const Context& update() const { return std::get<Context>(value_); }
    const Command& command() const { return std::get<Command>(value_); }

    // The state delta carried by this outcome, or null when there is none.
    Context delta() const;

private:
    std::variant<Context, Command> value_;
};

} // namespace graphflow

#endif // GRAPHFLOW_CORE_COMMAND_H
