// tests/test_builder.cpp
#include <catch2/catch_test_macros.hpp>
#include "graphflow/common/errors.h"
#include "graphflow/core/state_graph.h"
#include <algorithm>
#include <string>
#include <vector>

using namespace graphflow;

namespace {

NodeOutput pass_through(const Context&) {
    return Context::object();
}

// Violations reported by compile(), empty when it succeeds.
std::vector<std::string> compile_violations(const StateGraph& graph) {
    try {
        (void)graph.compile();
    } catch (const CompileError& e) {
        return e.violations();
    }
    return {};
}

bool mentions(const std::vector<std::string>& violations, const std::string& fragment) {
    return std::any_of(violations.begin(), violations.end(),
                       [&](const std::string& v) { return v.find(fragment) != std::string::npos; });
}

} // namespace

TEST_CASE("Minimal graph compiles", "[builder]") {
    StateGraph graph;
    graph.add_node("a", pass_through).set_entry_point("a").add_edge("a", END);

    CompiledGraph app = graph.compile();
    REQUIRE(app.entry_point() == "a");
    REQUIRE(app.nodes() == std::vector<NodeName>{"a"});
    REQUIRE(app.edges().size() == 1);
    REQUIRE(app.checkpointer() == nullptr);
}

TEST_CASE("Entry point is required", "[builder][validation]") {
    StateGraph graph;
    graph.add_node("a", pass_through);

    auto violations = compile_violations(graph);
    REQUIRE(violations.size() == 1);
    REQUIRE(mentions(violations, "no entry point"));
}

TEST_CASE("add_edge from START sets the entry point", "[builder]") {
    StateGraph graph;
    graph.add_node("a", pass_through).add_edge(START, "a");

    REQUIRE(graph.compile().entry_point() == "a");

    SECTION("a disagreeing set_entry_point is rejected") {
        graph.add_node("b", pass_through).set_entry_point("b");
        REQUIRE(mentions(compile_violations(graph), "conflicts with entry point 'b'"));
    }
}

TEST_CASE("Compile collects every violation", "[builder][validation]") {
    StateGraph graph;
    graph.add_node("a", pass_through)
         .add_node(END, pass_through)
         .set_entry_point("missing_entry")
         .add_edge("a", "ghost")
         .add_edge("phantom", "a")
         .add_edge("a", START)
         .add_edge(END, "a")
         .interrupt_before({"nobody"})
         .interrupt_after({"nobody_else"});

    REQUIRE_THROWS_AS(graph.compile(), CompileError);

    auto violations = compile_violations(graph);
    REQUIRE(violations.size() >= 7);
    REQUIRE(mentions(violations, "'__end__' is reserved"));
    REQUIRE(mentions(violations, "entry point 'missing_entry' is not a registered node"));
    REQUIRE(mentions(violations, "edge target 'ghost'"));
    REQUIRE(mentions(violations, "edge source 'phantom'"));
    REQUIRE(mentions(violations, "edge target cannot be START"));
    REQUIRE(mentions(violations, "edge source cannot be END"));
    REQUIRE(mentions(violations, "interrupt_before names unknown node 'nobody'"));
    REQUIRE(mentions(violations, "interrupt_after names unknown node 'nobody_else'"));
}

TEST_CASE("Conditional edge rules", "[builder][validation]") {
    auto router = [](const Context&) -> std::string { return "b"; };

    StateGraph graph;
    graph.add_node("a", pass_through).add_node("b", pass_through).set_entry_point("a");

    SECTION("conditional and fixed edges on one source are rejected") {
        graph.add_conditional_edges("a", router).add_edge("a", "b");
        REQUIRE(mentions(compile_violations(graph), "mixes conditional and fixed edges"));
    }
    SECTION("two conditional edges on one source are rejected") {
        graph.add_conditional_edges("a", router).add_conditional_edges("a", router);
        REQUIRE(mentions(compile_violations(graph), "at most one is allowed"));
    }
    SECTION("path map targets must exist") {
        graph.add_conditional_edges("a", router, {{"go", "b"}, {"stop", END}, {"lost", "nowhere"}});
        auto violations = compile_violations(graph);
        REQUIRE(violations.size() == 1);
        REQUIRE(mentions(violations, "unknown node 'nowhere'"));
    }
    SECTION("conditional source must exist") {
        graph.add_conditional_edges("zzz", router);
        REQUIRE(mentions(compile_violations(graph), "conditional edge source 'zzz'"));
    }
    SECTION("a valid conditional edge is exposed with its path map") {
        graph.add_conditional_edges("a", router, {{"b", "b"}, {"done", END}});
        CompiledGraph app = graph.compile();
        REQUIRE(app.conditional_edges().size() == 1);
        REQUIRE(app.conditional_edges()[0].source == "a");
        REQUIRE(app.conditional_edges()[0].path_map.at("done") == END);
    }
}

TEST_CASE("Conditional edge from START picks the entry at run time", "[builder]") {
    StateGraph graph;
    graph.add_node("left", [](const Context&) { return Context{{"went", "left"}}; })
         .add_node("right", [](const Context&) { return Context{{"went", "right"}}; })
         .add_conditional_edges(START, [](const Context& s) -> std::string {
             return s.value("dir", "left");
         });

    CompiledGraph app = graph.compile();
    REQUIRE(app.invoke({{"dir", "right"}}).state["went"] == "right");
    REQUIRE(app.invoke(Context::object()).state["went"] == "left");
}

TEST_CASE("Re-registering a node replaces it", "[builder]") {
    StateGraph graph;
    graph.add_node("a", [](const Context&) { return Context{{"v", 1}}; })
         .add_node("a", [](const Context&) { return Context{{"v", 2}}; })
         .set_entry_point("a");

    CompiledGraph app = graph.compile();
    REQUIRE(app.nodes().size() == 1);
    REQUIRE(app.invoke().state["v"] == 2);
}

TEST_CASE("Several fixed edges compile and the first is followed", "[builder]") {
    StateGraph graph;
    graph.add_node("a", pass_through)
         .add_node("b", [](const Context&) { return Context{{"last", "b"}}; })
         .add_node("c", [](const Context&) { return Context{{"last", "c"}}; })
         .set_entry_point("a")
         .add_edge("a", "b")
         .add_edge("a", "c");

    CompiledGraph app = graph.compile();
    REQUIRE(app.invoke().state["last"] == "b");
}

TEST_CASE("Builder stays usable after compile", "[builder]") {
    StateGraph graph;
    graph.add_node("a", pass_through).set_entry_point("a");
    CompiledGraph first = graph.compile();

    graph.add_node("b", pass_through).add_edge("a", "b");
    CompiledGraph second = graph.compile();

    REQUIRE(first.nodes().size() == 1);
    REQUIRE(second.nodes().size() == 2);
}
