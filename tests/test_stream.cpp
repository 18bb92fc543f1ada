// tests/test_stream.cpp
#include <catch2/catch_test_macros.hpp>
#include "graphflow/common/errors.h"
#include "graphflow/core/state_graph.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace graphflow;

namespace {

// a -> b -> c, each writes its own key.
CompiledGraph three_steps(std::shared_ptr<int> executed = std::make_shared<int>(0)) {
    StateGraph graph;
    for (const std::string name : {"a", "b", "c"}) {
        graph.add_node(name, [name, executed](const Context&) -> NodeOutput {
            ++*executed;
            return Context{{name, true}};
        });
    }
    graph.set_entry_point("a");
    graph.add_edge("a", "b");
    graph.add_edge("b", "c");
    return graph.compile();
}

} // namespace

TEST_CASE("Values mode yields the full state after each node", "[stream]") {
    auto stream = three_steps().stream(Context{{"input", 1}}, StreamMode::VALUES);

    std::vector<GraphEvent> events;
    while (auto event = stream.next()) {
        events.push_back(*event);
    }

    REQUIRE(events.size() == 3);
    REQUIRE(events[0].node == "a");
    REQUIRE(events[0].payload == Context{{"input", 1}, {"a", true}});
    REQUIRE(events[2].node == "c");
    REQUIRE(events[2].payload == Context{{"input", 1}, {"a", true}, {"b", true}, {"c", true}});
    REQUIRE(stream.done());
}

TEST_CASE("Updates mode yields only each node's delta", "[stream]") {
    auto stream = three_steps().stream(Context{{"input", 1}}, StreamMode::UPDATES);

    std::vector<Context> payloads;
    for (const GraphEvent& event : stream) {
        payloads.push_back(event.payload);
    }

    REQUIRE(payloads == std::vector<Context>{Context{{"a", true}}, Context{{"b", true}}, Context{{"c", true}}});
}

TEST_CASE("Streams are lazy and single-pass", "[stream]") {
    auto executed = std::make_shared<int>(0);
    auto stream = three_steps(executed).stream(Context::object());

    REQUIRE(*executed == 0);
    REQUIRE_FALSE(stream.done());

    auto first = stream.next();
    REQUIRE(first.has_value());
    REQUIRE(*executed == 1);

    while (stream.next()) {
    }
    REQUIRE(*executed == 3);
    REQUIRE_FALSE(stream.next().has_value());
}

TEST_CASE("Stream result is available only after exhaustion", "[stream]") {
    auto stream = three_steps().stream(Context::object());

    REQUIRE_THROWS_AS(stream.result(), std::logic_error);

    (void)stream.next();
    REQUIRE_THROWS_AS(stream.result(), std::logic_error);

    while (stream.next()) {
    }
    const GraphResult& result = stream.result();
    REQUIRE(result.is_complete());
    REQUIRE(result.state["c"] == true);
    REQUIRE(result.traces.size() == 3);
}

TEST_CASE("Final stream state matches invoke", "[stream]") {
    CompiledGraph app = three_steps();
    auto stream = app.stream(Context{{"x", 5}}, StreamMode::UPDATES);
    while (stream.next()) {
    }
    REQUIRE(stream.result().state == app.invoke(Context{{"x", 5}}).state);
}

TEST_CASE("Errors surface from next and end the stream", "[stream][errors]") {
    StateGraph graph;
    graph.add_node("ok", [](const Context&) -> NodeOutput { return Context{{"ok", true}}; });
    graph.add_node("fail", [](const Context&) -> NodeOutput {
        throw std::runtime_error("broken");
    });
    graph.set_entry_point("ok");
    graph.add_edge("ok", "fail");

    auto stream = graph.compile().stream(Context::object());

    auto first = stream.next();
    REQUIRE(first.has_value());
    REQUIRE(first->node == "ok");

    REQUIRE_THROWS_AS(stream.next(), NodeError);
    REQUIRE(stream.done());
    REQUIRE_FALSE(stream.next().has_value());
    REQUIRE_THROWS_AS(stream.result(), std::logic_error);
}

TEST_CASE("Stream modes parse from their names", "[stream][config]") {
    REQUIRE(parse_stream_mode("values") == StreamMode::VALUES);
    REQUIRE(parse_stream_mode("updates") == StreamMode::UPDATES);
    REQUIRE_THROWS(parse_stream_mode("debug"));
}
