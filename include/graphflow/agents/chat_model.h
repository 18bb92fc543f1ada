// graphflow/agents/chat_model.h
#ifndef GRAPHFLOW_AGENTS_CHAT_MODEL_H
#define GRAPHFLOW_AGENTS_CHAT_MODEL_H

#include "graphflow/common/types.h"
#include "graphflow/core/node.h"
#include "graphflow/tools/registry.h"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace graphflow {

// Boundary to an LLM provider. Returns one AI message (see agents/message.h).
class ChatModel {
public:
    virtual ~ChatModel() = default;
    virtual Value chat(const std::vector<Value>& messages, const std::vector<ToolDefinition>& tools) const = 0;
};

// Replays canned responses in order; throws once they run out.
class ScriptedChatModel : public ChatModel {
public:
    explicit ScriptedChatModel(std::vector<Value> responses);

    Value chat(const std::vector<Value>& messages, const std::vector<ToolDefinition>& tools) const override;

    size_t call_count() const;
    std::vector<std::vector<Value>> requests() const;
    std::vector<std::vector<ToolDefinition>> offered_tools() const;

private:
    std::vector<Value> responses_;
    mutable std::mutex mutex_;
    mutable size_t next_ = 0;
    mutable std::vector<std::vector<Value>> requests_;
    mutable std::vector<std::vector<ToolDefinition>> offered_tools_;
};

// 调用模型并把 AI 回复追加到 messages
class ChatModelNode : public Node {
public:
    ChatModelNode(std::shared_ptr<const ChatModel> model,
                  std::vector<ToolDefinition> tools,
                  std::optional<std::string> system_prompt = std::nullopt);

    [[nodiscard]] NodeOutput process(const Context& state) const override;

    // The AI reply to the conversation in `state`.
    Value respond(const Context& state) const;

private:
    std::shared_ptr<const ChatModel> model_;
    std::vector<ToolDefinition> tools_;
    std::optional<std::string> system_prompt_;
};

} // namespace graphflow

#endif // GRAPHFLOW_AGENTS_CHAT_MODEL_H
