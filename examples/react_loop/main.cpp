// main.cpp
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <nlohmann/json.hpp>
#include "graphflow/graphflow.h"

using namespace graphflow;

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "graphflow.yaml";

    try {
        // 1. 加载引擎配置
        EngineConfig config = load_engine_config(config_path);
        apply_engine_config(config);

        // 2. 注册工具
        auto tools = std::make_shared<ToolRegistry>();
        tools->register_tool("word_count", "Count the words in `text`", [](const Value& args) -> Value {
            std::istringstream iss(args.at("text").get<std::string>());
            int words = 0;
            std::string word;
            while (iss >> word) ++words;
            return Value{{"words", words}};
        }, Value{{"type", "object"}, {"properties", {{"text", {{"type", "string"}}}}}});

        // 3. 模型回复（脚本化，替代真实 LLM）
        auto model = std::make_shared<ScriptedChatModel>(std::vector<Value>{
            message::ai_with_tool_calls("Let me count.", {
                ToolCall{"call-1", "word_count", Value{{"text", "graphs all the way down"}}}
            }),
            message::ai("The sentence has 5 words.")
        });

        ReactAgentOptions options;
        options.system_prompt = "You are a careful assistant. Use tools when they help.";
        CompiledGraph agent = create_react_agent(model, tools, options);

        // 4. 流式执行，打印每个节点的增量
        auto stream = agent.stream(message_state({message::human("How many words in 'graphs all the way down'?")}),
                                   config.stream_mode);
        for (const GraphEvent& event : stream) {
            std::cout << "[" << event.node << "] " << event.payload.dump() << "\n";
        }

        const GraphResult& result = stream.result();
        std::cout << "\n[SUCCESS] " << message::content(*last_message(result.state)) << "\n";

        // 5. 导出 Trace
        std::ofstream trace_file("execution_trace.json");
        trace_file << traces_to_json(result.traces).dump(2) << std::endl;
        std::cout << "Trace exported to execution_trace.json (" << result.traces.size() << " records)\n";

    } catch (const GraphError& e) {
        std::cerr << "[GRAPH ERROR] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
