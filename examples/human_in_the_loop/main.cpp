// main.cpp
#include <fstream>
#include <iostream>
#include <string>
#include "graphflow/graphflow.h"

using namespace graphflow;

// draft -> review -> publish, paused before publish until a human approves.
CompiledGraph build_pipeline(std::shared_ptr<Checkpointer> checkpointer) {
    StateSchema schema;
    schema.field("history", merge_strategy::ARRAY_CONCAT)
          .field("revisions", merge_strategy::NUMERIC_ADD);

    StateGraph graph(schema);
    graph.add_node("draft", [](const Context& state) -> NodeOutput {
        std::string topic = state.value("topic", std::string("nothing"));
        return Context{
            {"draft", "A short note about " + topic + "."},
            {"history", Value::array({"drafted"})},
            {"revisions", 1}
        };
    });
    graph.add_node("review", [](const Context& state) -> NodeOutput {
        if (state.value("revisions", 0) < 2) {
            return Command::go_to_with_update("draft", Context{{"history", Value::array({"sent back"})}});
        }
        return Context{{"history", Value::array({"reviewed"})}};
    });
    graph.add_node("publish", [](const Context& state) -> NodeOutput {
        if (!state.value("approved", false)) {
            return Command::end_with_update(Context{{"history", Value::array({"rejected"})}});
        }
        return Context{{"published", state["draft"]}, {"history", Value::array({"published"})}};
    });
    graph.set_entry_point("draft")
         .add_edge("draft", "review")
         .add_edge("review", "publish")
         .add_edge("publish", END)
         .interrupt_before({"publish"});
    return graph.compile(std::move(checkpointer));
}

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "graphflow.yaml";

    try {
        EngineConfig config = load_engine_config(config_path);
        apply_engine_config(config);
        std::shared_ptr<Checkpointer> checkpointer = make_checkpointer(config);
        if (!checkpointer) {
            checkpointer = std::make_shared<MemoryCheckpointer>();
        }

        CompiledGraph app = build_pipeline(checkpointer);
        RunConfig thread("article-1");

        // 1. 运行到 publish 之前暂停
        GraphResult paused = app.invoke_with_config(Context{{"topic", "state machines"}}, thread);
        if (!paused.is_interrupted()) {
            std::cerr << "[ERROR] expected the pipeline to pause before publishing\n";
            return 1;
        }
        std::cout << "[PAUSED] next node: " << paused.next_node.value_or(END) << "\n";
        std::cout << "Draft: " << paused.state["draft"].get<std::string>() << "\n";

        // 2. 人工审批：写入检查点
        std::cout << "Approve? [y/N] " << std::flush;
        std::string answer;
        std::getline(std::cin, answer);
        app.update_state(thread, Context{{"approved", answer == "y" || answer == "Y"}});

        // 3. 从检查点恢复
        GraphResult finished = app.invoke_with_config(Context::object(), thread);
        std::cout << "[DONE] history: " << finished.state["history"].dump() << "\n";

        // 4. 检查点历史
        for (const auto& checkpoint : app.get_state_history(thread)) {
            std::cout << "  " << format_timestamp(checkpoint.timestamp) << "  "
                      << checkpoint.metadata.value("reason", std::string("?")) << " -> "
                      << checkpoint.next_node << "\n";
        }

        // 5. 导出本次恢复的 Trace
        std::ofstream trace_file("execution_trace.json");
        trace_file << traces_to_json(finished.traces).dump(2) << std::endl;
        std::cout << "Trace exported to execution_trace.json (" << finished.traces.size() << " records)\n";

    } catch (const GraphError& e) {
        std::cerr << "[GRAPH ERROR] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
