// agents/message.cpp
#include "graphflow/agents/message.h"

namespace graphflow {

void to_json(nlohmann::json& j, const ToolCall& call) {
    j = nlohmann::json{{"id", call.id}, {"name", call.name}, {"arguments", call.arguments}};
}

void from_json(const nlohmann::json& j, ToolCall& call) {
    call.id = j.value("id", "");
    j.at("name").get_to(call.name);
    call.arguments = j.value("arguments", nlohmann::json::object());
}

namespace message {

namespace {

Value make(const char* role, const std::string& content) {
    return Value{{"role", role}, {"content", content}};
}

} // namespace

Value human(const std::string& content) { return make("human", content); }
Value ai(const std::string& content) { return make("ai", content); }
Value system(const std::string& content) { return make("system", content); }

Value ai_with_tool_calls(const std::string& content, const std::vector<ToolCall>& tool_calls) {
    Value msg = make("ai", content);
    msg["tool_calls"] = tool_calls;
    return msg;
}

Value tool(const std::string& content, const std::string& tool_call_id) {
    Value msg = make("tool", content);
    msg["tool_call_id"] = tool_call_id;
    return msg;
}

std::string role(const Value& msg) {
    return msg.is_object() ? msg.value("role", "") : "";
}

std::string content(const Value& msg) {
    if (!msg.is_object() || !msg.contains("content")) return "";
    const Value& c = msg["content"];
    return c.is_string() ? c.get<std::string>() : c.dump();
}

bool is_ai(const Value& msg) {
    return role(msg) == "ai";
}

std::vector<ToolCall> tool_calls(const Value& msg) {
    if (!msg.is_object() || !msg.contains("tool_calls") || !msg["tool_calls"].is_array()) {
        return {};
    }
    return msg["tool_calls"].get<std::vector<ToolCall>>();
}

} // namespace message

StateSchema message_state_schema() {
    StateSchema schema;
    schema.field(MESSAGES_KEY, merge_strategy::ARRAY_CONCAT);
    return schema;
}

Context message_state(const std::vector<Value>& messages) {
    return Context{{MESSAGES_KEY, messages}};
}

std::vector<Value> messages_of(const Context& state) {
    if (!state.is_object() || !state.contains(MESSAGES_KEY) || !state[MESSAGES_KEY].is_array()) {
        return {};
    }
    return state[MESSAGES_KEY].get<std::vector<Value>>();
}

std::optional<Value> last_message(const Context& state) {
    if (!state.is_object() || !state.contains(MESSAGES_KEY)) {
        return std::nullopt;
    }
    const Value& messages = state[MESSAGES_KEY];
    if (!messages.is_array() || messages.empty()) {
        return std::nullopt;
    }
    return messages.back();
}

} // namespace graphflow
