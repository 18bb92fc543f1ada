// graphflow/agents/message.h
#ifndef GRAPHFLOW_AGENTS_MESSAGE_H
#define GRAPHFLOW_AGENTS_MESSAGE_H

#include "graphflow/common/types.h"
#include "graphflow/core/state.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace graphflow {

// Chat messages are plain JSON objects:
//   {"role": "human"|"ai"|"system"|"tool", "content": "...",
//    "tool_calls": [{"id", "name", "arguments"}], "tool_call_id": "..."}
inline constexpr const char* MESSAGES_KEY = "messages";

struct ToolCall {
    std::string id;
    std::string name;
    Value arguments = Value::object();
};

void to_json(nlohmann::json& j, const ToolCall& call);
void from_json(const nlohmann::json& j, ToolCall& call);

namespace message {

Value human(const std::string& content);
Value ai(const std::string& content);
Value ai_with_tool_calls(const std::string& content, const std::vector<ToolCall>& tool_calls);
Value system(const std::string& content);
Value tool(const std::string& content, const std::string& tool_call_id);

std::string role(const Value& msg);
std::string content(const Value& msg);
bool is_ai(const Value& msg);
std::vector<ToolCall> tool_calls(const Value& msg);

} // namespace message

// {"messages": [...]} state with `messages` merged by array_concat
StateSchema message_state_schema();
Context message_state(const std::vector<Value>& messages);
std::vector<Value> messages_of(const Context& state);
std::optional<Value> last_message(const Context& state);

} // namespace graphflow

#endif // GRAPHFLOW_AGENTS_MESSAGE_H
