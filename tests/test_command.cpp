// tests/test_command.cpp
#include <catch2/catch_test_macros.hpp>
#include "graphflow/common/errors.h"
#include "graphflow/core/command.h"
#include "graphflow/core/state_graph.h"
#include <functional>
#include <string>
#include <vector>

using namespace graphflow;

namespace {

// router -> {a, b}; the router's conditional edge always says "a".
StateGraph routed_graph(std::function<NodeOutput(const Context&)> router_node) {
    StateGraph graph(StateSchema().field("visited", merge_strategy::ARRAY_CONCAT));
    graph.add_node("router", std::move(router_node));
    graph.add_node("a", [](const Context&) -> NodeOutput {
        return Context{{"visited", Context::array({"a"})}};
    });
    graph.add_node("b", [](const Context&) -> NodeOutput {
        return Context{{"visited", Context::array({"b"})}};
    });
    graph.set_entry_point("router");
    graph.add_conditional_edges("router", [](const Context&) -> std::string { return "a"; });
    return graph;
}

} // namespace

TEST_CASE("Command factories fill the right fields", "[command]") {
    Command go = Command::go_to("next");
    REQUIRE(go.kind == Command::Kind::GOTO);
    REQUIRE(*go.target == "next");
    REQUIRE_FALSE(go.delta.has_value());

    Command go_update = Command::go_to_with_update("next", Context{{"k", 1}});
    REQUIRE(go_update.kind == Command::Kind::GOTO);
    REQUIRE(*go_update.delta == Context{{"k", 1}});

    REQUIRE(Command::end().kind == Command::Kind::END);
    REQUIRE(Command::update(Context{{"k", 2}}).kind == Command::Kind::UPDATE);

    Command fan = Command::send({Send("x"), Send("y", Context{{"item", 3}})});
    REQUIRE(fan.kind == Command::Kind::SEND);
    REQUIRE(fan.sends.size() == 2);
    REQUIRE_FALSE(fan.sends[0].state.has_value());
    REQUIRE(*fan.sends[1].state == Context{{"item", 3}});

    Command pause = Command::interrupt("approve?");
    REQUIRE(pause.kind == Command::Kind::INTERRUPT);
    REQUIRE(pause.interrupt_value == "approve?");
}

TEST_CASE("NodeOutput exposes the carried delta", "[command]") {
    NodeOutput plain(Context{{"x", 1}});
    REQUIRE_FALSE(plain.is_command());
    REQUIRE(plain.delta() == Context{{"x", 1}});

    NodeOutput with_update(Command::end_with_update(Context{{"y", 2}}));
    REQUIRE(with_update.is_command());
    REQUIRE(with_update.delta() == Context{{"y", 2}});

    NodeOutput bare(Command::go_to("z"));
    REQUIRE(bare.delta().is_null());

    NodeOutput empty;
    REQUIRE(empty.delta() == Context::object());
}

TEST_CASE("Goto bypasses the conditional edge", "[command][engine]") {
    StateGraph graph = routed_graph([](const Context&) -> NodeOutput { return Command::go_to("b"); });

    GraphResult result = graph.compile().invoke();

    REQUIRE(result.is_complete());
    REQUIRE(result.state["visited"] == Context::array({"b"}));
}

TEST_CASE("Goto with update merges before moving on", "[command][engine]") {
    StateGraph graph = routed_graph([](const Context&) -> NodeOutput {
        return Command::go_to_with_update("b", Context{{"visited", Context::array({"router"})}});
    });

    GraphResult result = graph.compile().invoke();

    REQUIRE(result.state["visited"] == Context::array({"router", "b"}));
}

TEST_CASE("Goto END and Command::end terminate the run", "[command][engine]") {
    SECTION("end") {
        StateGraph graph = routed_graph([](const Context&) -> NodeOutput { return Command::end(); });
        GraphResult result = graph.compile().invoke();
        REQUIRE(result.is_complete());
        REQUIRE_FALSE(result.state.contains("visited"));
    }

    SECTION("end with update") {
        StateGraph graph = routed_graph([](const Context&) -> NodeOutput {
            return Command::end_with_update(Context{{"visited", Context::array({"router"})}});
        });
        GraphResult result = graph.compile().invoke();
        REQUIRE(result.state["visited"] == Context::array({"router"}));
    }

    SECTION("goto END") {
        StateGraph graph = routed_graph([](const Context&) -> NodeOutput { return Command::go_to(END); });
        GraphResult result = graph.compile().invoke();
        REQUIRE(result.is_complete());
        REQUIRE_FALSE(result.state.contains("visited"));
    }
}

TEST_CASE("Update command follows ordinary edges", "[command][engine]") {
    StateGraph graph = routed_graph([](const Context&) -> NodeOutput {
        return Command::update(Context{{"visited", Context::array({"router"})}});
    });

    GraphResult result = graph.compile().invoke();

    REQUIRE(result.state["visited"] == Context::array({"router", "a"}));
}

TEST_CASE("Goto to an unregistered node raises RoutingError", "[command][engine]") {
    StateGraph graph = routed_graph([](const Context&) -> NodeOutput { return Command::go_to("ghost"); });

    REQUIRE_THROWS_AS(graph.compile().invoke(), RoutingError);
}

TEST_CASE("Goto can drive a loop without any edges", "[command][engine]") {
    StateGraph graph(StateSchema().field("n", merge_strategy::NUMERIC_ADD));
    graph.add_node("tick", [](const Context& state) -> NodeOutput {
        if (state.value("n", 0) >= 4) {
            return Command::end();
        }
        return Command::go_to_with_update("tick", Context{{"n", 1}});
    });
    graph.set_entry_point("tick");

    GraphResult result = graph.compile().invoke(Context{{"n", 0}});

    REQUIRE(result.state["n"] == 4);
    REQUIRE(result.traces.size() == 5);
}
