// agents/tool_node.cpp
#include "graphflow/agents/tool_node.h"
#include <stdexcept>

namespace graphflow {

ToolNode::ToolNode(std::shared_ptr<const ToolRegistry> registry) : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("ToolNode requires a tool registry");
    }
}

Value ToolNode::execute(const ToolCall& call) const {
    Value result = registry_->call_tool(call.name, call.arguments);
    return message::tool(result.is_string() ? result.get<std::string>() : result.dump(), call.id);
}

NodeOutput ToolNode::process(const Context& state) const {
    std::optional<Value> last = last_message(state);
    if (!last) {
        throw std::runtime_error("no messages in state");
    }

    Value replies = Value::array();
    for (const auto& call : message::tool_calls(*last)) {
        replies.push_back(execute(call));
    }
    if (replies.empty()) {
        return Context::object();
    }
    return Context{{MESSAGES_KEY, replies}};
}

} // namespace graphflow
