// tests/test_state.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>
#include <catch2/generators/catch_generators_random.hpp>
#include "graphflow/common/errors.h"
#include "graphflow/core/state.h"
#include <random>
#include <stdexcept>
#include <string>

using graphflow::Context;
using graphflow::StateSchema;
namespace ms = graphflow::merge_strategy;

TEST_CASE("Default schema is last-write-wins per field", "[state]") {
    StateSchema schema;
    Context current = {{"a", 1}, {"b", "keep"}, {"nested", {{"x", 1}, {"y", 2}}}};
    Context merged = schema.merge(current, {{"a", 2}, {"nested", {{"x", 9}}}, {"c", true}});

    REQUIRE(merged["a"] == 2);
    REQUIRE(merged["b"] == "keep");
    REQUIRE(merged["c"] == true);
    // Objects are replaced, not merged, unless the field is deep_merge
    REQUIRE(merged["nested"] == Context{{"x", 9}});
}

TEST_CASE("Null and non-object updates", "[state]") {
    StateSchema schema;
    Context current = {{"a", 1}};

    SECTION("null update leaves the state untouched") {
        REQUIRE(schema.merge(current, Context()) == current);
    }
    SECTION("non-object update replaces the state wholesale") {
        REQUIRE(schema.merge(current, Context::array({1, 2})) == Context::array({1, 2}));
    }
    SECTION("null state becomes an object") {
        REQUIRE(schema.merge(Context(), {{"a", 1}}) == current);
    }
}

TEST_CASE("Array strategies", "[state]") {
    StateSchema schema;
    schema.field("log", ms::ARRAY_CONCAT).field("tags", ms::ARRAY_MERGE_UNIQUE);

    Context state = {{"log", {"a"}}, {"tags", {"x"}}};
    state = schema.merge(state, {{"log", {"b", "c"}}, {"tags", {"x", "y"}}});
    REQUIRE(state["log"] == Context::array({"a", "b", "c"}));
    REQUIRE(state["tags"] == Context::array({"x", "y"}));

    SECTION("a single value is appended as one element") {
        state = schema.merge(state, {{"log", "d"}});
        REQUIRE(state["log"].size() == 4);
        REQUIRE(state["log"].back() == "d");
    }
    SECTION("a missing field starts as an array") {
        Context fresh = schema.merge(Context::object(), {{"log", "first"}});
        REQUIRE(fresh["log"] == Context::array({"first"}));
    }
    SECTION("appending to a scalar field is a merge error") {
        Context bad = {{"log", 5}};
        REQUIRE_THROWS_AS(schema.merge(bad, {{"log", {1}}}), graphflow::StateMergeError);
    }
}

TEST_CASE("Append merge is associative", "[state][property]") {
    StateSchema schema;
    schema.field("items", ms::ARRAY_CONCAT);

    Context s = {{"items", {0}}};
    Context a = {{"items", {1, 2}}};
    Context b = {{"items", {3}}};

    Context left = schema.merge(schema.merge(s, a), b);
    Context combined = schema.merge(a, b);
    Context right = schema.merge(s, combined);
    REQUIRE(left == right);
    REQUIRE(left["items"] == Context::array({0, 1, 2, 3}));
}

TEST_CASE("Folding a message batch equals merging it at once", "[state][property]") {
    StateSchema schema;
    schema.field("messages", ms::ARRAY_CONCAT);

    auto seed = GENERATE(take(25, random(1, 1000000)));
    std::mt19937 rng(static_cast<unsigned>(seed));
    std::uniform_int_distribution<int> batch_size(0, 8);
    std::uniform_int_distribution<int> update_size(0, 3);

    Context initial = {{"messages", Context::array({"seed"})}};
    Context folded = initial;
    Context batch = {{"messages", Context::array()}};

    int updates = batch_size(rng);
    for (int i = 0; i < updates; ++i) {
        Context update = {{"messages", Context::array()}};
        int n = update_size(rng);
        for (int j = 0; j < n; ++j) {
            update["messages"].push_back("m" + std::to_string(rng() % 1000));
        }
        folded = schema.merge(folded, update);
        batch = schema.merge(batch, update);
    }

    REQUIRE(folded == schema.merge(initial, batch));
}

TEST_CASE("Numeric add, deep merge and conflicts", "[state]") {
    StateSchema schema;
    schema.field("counter", ms::NUMERIC_ADD)
          .field("config", ms::DEEP_MERGE)
          .field("id", ms::ERROR_ON_CONFLICT);

    Context state = {{"counter", 1}, {"config", {{"a", 1}, {"inner", {{"b", 2}}}}}, {"id", "x"}};

    SECTION("counters add up") {
        state = schema.merge(state, {{"counter", 10}});
        REQUIRE(state["counter"] == 11);
        state = schema.merge(state, {{"counter", 0.5}});
        REQUIRE(state["counter"].get<double>() == 11.5);
    }
    SECTION("deep_merge recurses into objects") {
        state = schema.merge(state, {{"config", {{"c", 3}}}});
        REQUIRE(state["config"]["a"] == 1);
        REQUIRE(state["config"]["c"] == 3);
        REQUIRE(state["config"]["inner"]["b"] == 2);
    }
    SECTION("error_on_conflict accepts equal values only") {
        REQUIRE_NOTHROW(schema.merge(state, {{"id", "x"}}));
        REQUIRE_THROWS_AS(schema.merge(state, {{"id", "y"}}), graphflow::StateMergeError);
    }
    SECTION("numeric_add rejects non-numbers") {
        REQUIRE_THROWS_AS(schema.merge(state, {{"counter", "ten"}}), graphflow::StateMergeError);
    }
}

TEST_CASE("Wildcard field policies pick the longest prefix", "[state]") {
    StateSchema schema;
    schema.field("results", ms::DEEP_MERGE)
          .field("results.*", ms::ARRAY_CONCAT)
          .field("results.scores*", ms::NUMERIC_ADD);

    REQUIRE(schema.strategy_for("results") == ms::DEEP_MERGE);
    REQUIRE(schema.strategy_for("results.items") == ms::ARRAY_CONCAT);
    REQUIRE(schema.strategy_for("results.scores") == ms::NUMERIC_ADD);
    REQUIRE(schema.strategy_for("other") == ms::LAST_WRITE_WINS);

    Context state = {{"results", {{"items", {1}}, {"scores", 1}}}};
    state = schema.merge(state, {{"results", {{"items", {2}}, {"scores", 2}}}});
    REQUIRE(state["results"]["items"] == Context::array({1, 2}));
    REQUIRE(state["results"]["scores"] == 3);
}

TEST_CASE("Unknown strategies are rejected", "[state]") {
    StateSchema schema;
    REQUIRE_THROWS_AS(schema.field("a", "append_everything"), std::invalid_argument);
    REQUIRE_THROWS_AS(StateSchema("nope"), std::invalid_argument);
    REQUIRE_THROWS_AS(schema.field("", ms::ARRAY_CONCAT), std::invalid_argument);
}

TEST_CASE("Diff produces the update that merge replays", "[state]") {
    StateSchema schema;
    schema.field("messages", ms::ARRAY_CONCAT).field("count", ms::NUMERIC_ADD);

    Context before = {{"messages", {"hi"}}, {"count", 2}, {"topic", "a"}};
    Context after = {{"messages", {"hi", "hello", "bye"}}, {"count", 5}, {"topic", "b"}, {"new", 1}};

    Context delta = schema.diff(before, after);
    REQUIRE(delta["messages"] == Context::array({"hello", "bye"}));
    REQUIRE(delta["count"] == 3);
    REQUIRE(delta["topic"] == "b");
    REQUIRE(delta["new"] == 1);
    REQUIRE(schema.merge(before, delta) == after);

    SECTION("unchanged fields are omitted") {
        REQUIRE(schema.diff(before, before).empty());
    }
    SECTION("a rewritten append-only prefix cannot be expressed") {
        Context rewritten = {{"messages", {"changed"}}};
        REQUIRE_THROWS_AS(schema.diff(before, rewritten), graphflow::StateMergeError);
    }
}
