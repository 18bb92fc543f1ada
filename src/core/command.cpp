// core/command.cpp
#include "graphflow/core/command.h"

namespace graphflow {

Command Command::go_to(NodeName target) {
    Command cmd;
    cmd.kind = Kind::GOTO;
    cmd.target = std::move(target);
    return cmd;
}

Command Command::go_to_with_update(NodeName target, Context update) {
    Command cmd = go_to(std::move(target));
    cmd.delta = std::move(update);
    return cmd;
}

Command Command::end() {
    Command cmd;
    cmd.kind = Kind::END;
    return cmd;
}

Command Command::end_with_update(Context update) {
    Command cmd = end();
    cmd.delta = std::move(update);
    return cmd;
}

Command Command::update(Context update) {
    Command cmd;
    cmd.kind = Kind::UPDATE;
    cmd.delta = std::move(update);
    return cmd;
}

Command Command::send(std::vector<Send> targets) {
    Command cmd;
    cmd.kind = Kind::SEND;
    cmd.sends = std::move(targets);
    return cmd;
}

Command Command::interrupt(Value payload) {
    Command cmd;
    cmd.kind = Kind::INTERRUPT;
    cmd.interrupt_value = std::move(payload);
    return cmd;
}

Command Command::interrupt_with_update(Value payload, Context update) {
    Command cmd = interrupt(std::move(payload));
    cmd.delta = std::move(update);
    return cmd;
}

Context NodeOutput::delta() const {
    if (!is_command()) {
        return update();
    }
    const Command& cmd = command();
    return cmd.delta ? *cmd.delta : Context();
}

} // namespace graphflow
