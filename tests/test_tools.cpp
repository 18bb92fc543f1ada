// tests/test_tools.cpp
#include <catch2/catch_test_macros.hpp>
#include "graphflow/agents/message.h"
#include "graphflow/agents/tool_node.h"
#include "graphflow/common/template_renderer.h"
#include "graphflow/tools/registry.h"
#include <memory>
#include <stdexcept>
#include <string>

using namespace graphflow;

namespace {

std::shared_ptr<ToolRegistry> make_registry() {
    auto registry = std::make_shared<ToolRegistry>();
    registry->register_tool("add", "Add two integers", [](const Value& args) -> Value {
        return args.at("a").get<int>() + args.at("b").get<int>();
    }, Value{{"type", "object"}, {"required", Value::array({"a", "b"})}});
    registry->register_tool("echo", "Echo the text argument", [](const Value& args) -> Value {
        return args.value("text", std::string());
    });
    registry->register_tool("fail", "Always fails", [](const Value&) -> Value {
        throw std::runtime_error("service unavailable");
    });
    return registry;
}

} // namespace

TEST_CASE("Registry calls tools and lists them by name", "[tools]") {
    auto registry = make_registry();

    REQUIRE(registry->has_tool("add"));
    REQUIRE_FALSE(registry->has_tool("multiply"));
    REQUIRE(registry->list_tools() == std::vector<std::string>{"add", "echo", "fail"});
    REQUIRE(registry->call_tool("add", Value{{"a", 2}, {"b", 3}}) == 5);
    REQUIRE(registry->call_tool("echo", Value{{"text", "hi"}}) == "hi");
}

TEST_CASE("Registry reports failures as error objects", "[tools][errors]") {
    auto registry = make_registry();

    Value missing = registry->call_tool("multiply", Value::object());
    REQUIRE(missing["error"] == "Tool not found: multiply");

    Value failed = registry->call_tool("fail", Value::object());
    REQUIRE(failed["error"] == "Tool execution failed: service unavailable");

    // bad arguments surface the same way
    Value bad_args = registry->call_tool("add", Value{{"a", 1}});
    REQUIRE(bad_args.contains("error"));
}

TEST_CASE("Tool definitions serialize for the model", "[tools]") {
    auto registry = make_registry();

    std::vector<ToolDefinition> defs = registry->definitions();
    REQUIRE(defs.size() == 3);

    nlohmann::json j = defs[0];
    REQUIRE(j["name"] == "add");
    REQUIRE(j["description"] == "Add two integers");
    REQUIRE(j["parameters"]["required"] == Value::array({"a", "b"}));
}

TEST_CASE("Message helpers build and read chat messages", "[tools][messages]") {
    Value human = message::human("hello");
    REQUIRE(message::role(human) == "human");
    REQUIRE(message::content(human) == "hello");
    REQUIRE_FALSE(message::is_ai(human));

    Value call = message::ai_with_tool_calls("", {ToolCall{"call-1", "add", Value{{"a", 1}, {"b", 2}}}});
    REQUIRE(message::is_ai(call));
    auto calls = message::tool_calls(call);
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].id == "call-1");
    REQUIRE(calls[0].arguments["b"] == 2);

    Value reply = message::tool("3", "call-1");
    REQUIRE(reply["tool_call_id"] == "call-1");
    REQUIRE(message::tool_calls(reply).empty());

    Context state = message_state({human, call});
    REQUIRE(messages_of(state).size() == 2);
    REQUIRE(last_message(state).has_value());
    REQUIRE(*last_message(state) == call);
    REQUIRE_FALSE(last_message(Context::object()).has_value());
}

TEST_CASE("Message schema appends messages", "[tools][messages]") {
    StateSchema schema = message_state_schema();
    Context state = message_state({message::human("a")});

    Context merged = schema.merge(state, message_state({message::ai("b")}));

    REQUIRE(messages_of(merged).size() == 2);
    REQUIRE(message::content(messages_of(merged)[1]) == "b");
}

TEST_CASE("ToolNode answers every call of the last message in order", "[tools][node]") {
    ToolNode node(make_registry());
    Context state = message_state({
        message::human("add and echo"),
        message::ai_with_tool_calls("", {
            ToolCall{"c1", "add", Value{{"a", 20}, {"b", 22}}},
            ToolCall{"c2", "echo", Value{{"text", "done"}}},
            ToolCall{"c3", "nope", Value::object()}
        })
    });

    NodeOutput output = node.process(state);

    REQUIRE_FALSE(output.is_command());
    const Value& replies = output.update()[MESSAGES_KEY];
    REQUIRE(replies.size() == 3);
    REQUIRE(message::role(replies[0]) == "tool");
    REQUIRE(message::content(replies[0]) == "42");
    REQUIRE(replies[0]["tool_call_id"] == "c1");
    REQUIRE(message::content(replies[1]) == "done");
    REQUIRE(message::content(replies[2]).find("Tool not found") != std::string::npos);
}

TEST_CASE("ToolNode without calls leaves the state alone", "[tools][node]") {
    ToolNode node(make_registry());

    NodeOutput output = node.process(message_state({message::ai("no tools needed")}));
    REQUIRE(output.update() == Context::object());

    REQUIRE_THROWS_AS(node.process(Context::object()), std::runtime_error);
    REQUIRE_THROWS_AS(ToolNode(nullptr), std::invalid_argument);
}

TEST_CASE("Template renderer fills prompts from state", "[tools][template]") {
    Context data = {{"agent", "researcher"}, {"peers", Value::array({"writer", "editor"})}};

    std::string rendered = InjaTemplateRenderer::render("You are {{ agent }}; peers: {{ join(peers, \", \") }}.", data);
    REQUIRE(rendered == "You are researcher; peers: writer, editor.");

    REQUIRE_THROWS_AS(InjaTemplateRenderer::render("{{ missing_var }}", data), std::runtime_error);
}
