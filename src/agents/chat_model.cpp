// agents/chat_model.cpp
#include "graphflow/agents/chat_model.h"
#include "graphflow/agents/message.h"
#include <stdexcept>

namespace graphflow {

ScriptedChatModel::ScriptedChatModel(std::vector<Value> responses) : responses_(std::move(responses)) {}

Value ScriptedChatModel::chat(const std::vector<Value>& messages, const std::vector<ToolDefinition>& tools) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(messages);
    offered_tools_.push_back(tools);
    if (next_ >= responses_.size()) {
        throw std::runtime_error("ScriptedChatModel exhausted after " + std::to_string(responses_.size()) + " response(s)");
    }
    return responses_[next_++];
}

size_t ScriptedChatModel::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

std::vector<std::vector<Value>> ScriptedChatModel::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::vector<std::vector<ToolDefinition>> ScriptedChatModel::offered_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return offered_tools_;
}

ChatModelNode::ChatModelNode(std::shared_ptr<const ChatModel> model,
                             std::vector<ToolDefinition> tools,
                             std::optional<std::string> system_prompt)
    : model_(std::move(model)), tools_(std::move(tools)), system_prompt_(std::move(system_prompt)) {
    if (!model_) {
        throw std::invalid_argument("ChatModelNode requires a model");
    }
}

Value ChatModelNode::respond(const Context& state) const {
    std::vector<Value> messages;
    if (system_prompt_) {
        messages.push_back(message::system(*system_prompt_));
    }
    for (auto& msg : messages_of(state)) {
        messages.push_back(std::move(msg));
    }

    Value reply = model_->chat(messages, tools_);
    if (!message::is_ai(reply)) {
        throw std::runtime_error("Chat model returned a non-AI message: " + reply.dump());
    }
    return reply;
}

NodeOutput ChatModelNode::process(const Context& state) const {
    return Context{{MESSAGES_KEY, Value::array({respond(state)})}};
}

} // namespace graphflow
