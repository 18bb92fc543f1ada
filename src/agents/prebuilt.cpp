// agents/prebuilt.cpp
#include "graphflow/agents/prebuilt.h"
#include "graphflow/agents/tool_node.h"
#include "graphflow/common/errors.h"
#include "graphflow/common/logging.h"
#include "graphflow/common/template_renderer.h"
#include "graphflow/core/state_graph.h"
#include "graphflow/core/subgraph_node.h"
#include <algorithm>
#include <iterator>
#include <set>

namespace graphflow {

namespace {

constexpr const char* DEFAULT_SUPERVISOR_PROMPT =
    "You are a supervisor managing these agents: {{ join(agents, \", \") }}. "
    "Use the transfer tools to delegate tasks to the appropriate agent. "
    "When the task is complete, respond directly to the user.";

constexpr const char* HANDOFF_PREFIX = "transfer_to_";

std::string route_tool_calls(const Context& state) {
    std::optional<Value> last = last_message(state);
    if (last && !message::tool_calls(*last).empty()) {
        return "tools";
    }
    return END;
}

std::optional<std::string> handoff_agent(const std::string& tool_name, const std::vector<std::string>& agents) {
    if (!tool_name.starts_with(HANDOFF_PREFIX)) {
        return std::nullopt;
    }
    std::string agent = tool_name.substr(std::char_traits<char>::length(HANDOFF_PREFIX));
    if (std::find(agents.begin(), agents.end(), agent) == agents.end()) {
        return std::nullopt;
    }
    return agent;
}

Value transfer_reply(const ToolCall& call, const std::string& agent) {
    return message::tool("Transferring to agent '" + agent + "'.", call.id);
}

void check_agent_names(const std::vector<std::string>& names, const char* pattern, const std::string& reserved) {
    std::set<std::string> seen;
    for (const auto& name : names) {
        if (name.empty() || name == START || name == END || name == reserved) {
            throw GraphError(std::string(pattern) + " agent name '" + name + "' is reserved");
        }
        if (!seen.insert(name).second) {
            throw GraphError(std::string(pattern) + " agent '" + name + "' is registered twice");
        }
    }
}

// 监督者：调用模型，若模型发出 transfer_to_<agent> 则跳转到该子图
class SupervisorNode : public Node {
public:
    SupervisorNode(ChatModelNode model, std::vector<std::string> agents)
        : model_(std::move(model)), agents_(std::move(agents)) {}

    NodeOutput process(const Context& state) const override {
        Value reply = model_.respond(state);
        Value added = Value::array({reply});

        std::optional<std::string> target = find_handoff_target(reply, agents_);
        if (!target) {
            return Context{{MESSAGES_KEY, added}};
        }

        for (const auto& call : message::tool_calls(reply)) {
            if (auto agent = handoff_agent(call.name, agents_)) {
                added.push_back(transfer_reply(call, *agent));
            } else {
                added.push_back(message::tool("Tool '" + call.name + "' is not available to the supervisor.", call.id));
            }
        }
        logger().debug("Supervisor delegates to '" + *target + "'");
        return Command::go_to_with_update(*target, Context{{MESSAGES_KEY, added}});
    }

private:
    ChatModelNode model_;
    std::vector<std::string> agents_;
};

// 群体中的一个成员：内部 ReAct 子图，遇到 handoff 时直接 Goto 到对等节点
class SwarmAgentNode : public Node {
public:
    SwarmAgentNode(std::string name, CompiledGraph graph, std::vector<std::string> peers,
                   std::shared_ptr<const ToolRegistry> tools)
        : name_(std::move(name)), graph_(std::move(graph)), peers_(std::move(peers)), tools_(std::move(tools)) {}

    NodeOutput process(const Context& state) const override {
        GraphResult result = graph_.invoke(state);
        Context delta = graph_.schema().diff(state, result.state);

        std::optional<Value> last = last_message(result.state);
        std::optional<std::string> target = last ? find_handoff_target(*last, peers_) : std::nullopt;
        if (!target) {
            return delta;
        }

        // Answer every call of the handoff message so the conversation stays well-formed.
        if (!delta.contains(MESSAGES_KEY) || !delta[MESSAGES_KEY].is_array()) {
            delta[MESSAGES_KEY] = Value::array();
        }
        for (const auto& call : message::tool_calls(*last)) {
            if (auto agent = handoff_agent(call.name, peers_)) {
                delta[MESSAGES_KEY].push_back(transfer_reply(call, *agent));
            } else if (tools_) {
                delta[MESSAGES_KEY].push_back(ToolNode(tools_).execute(call));
            } else {
                delta[MESSAGES_KEY].push_back(message::tool("Tool '" + call.name + "' is not available.", call.id));
            }
        }
        logger().debug("Swarm agent '" + name_ + "' hands off to '" + *target + "'");
        return Command::go_to_with_update(*target, delta);
    }

private:
    std::string name_;
    CompiledGraph graph_;
    std::vector<std::string> peers_;
    std::shared_ptr<const ToolRegistry> tools_;
};

CompiledGraph build_swarm_member(const SwarmAgent& agent, const std::vector<std::string>& peers) {
    std::vector<ToolDefinition> tool_defs = agent.tools ? agent.tools->definitions() : std::vector<ToolDefinition>{};
    for (const auto& peer : peers) {
        tool_defs.push_back(create_handoff_tool(peer));
    }

    std::optional<std::string> prompt;
    if (agent.system_prompt) {
        prompt = InjaTemplateRenderer::render(*agent.system_prompt, Context{{"agent", agent.name}, {"peers", peers}});
    }

    StateGraph graph(message_state_schema());
    graph.add_node("agent", std::make_shared<ChatModelNode>(agent.model, std::move(tool_defs), prompt))
         .set_entry_point("agent");

    bool has_tools = agent.tools != nullptr;
    if (has_tools) {
        graph.add_node("tools", std::make_shared<ToolNode>(agent.tools))
             .add_edge("tools", "agent");
    }
    graph.add_conditional_edges("agent", [peers, has_tools](const Context& state) -> std::string {
        std::optional<Value> last = last_message(state);
        if (!last) return END;
        std::vector<ToolCall> calls = message::tool_calls(*last);
        if (calls.empty() || !has_tools) return END;
        // handoff 由外层节点处理
        if (find_handoff_target(*last, peers)) return END;
        return "tools";
    });
    return graph.compile();
}

} // namespace

CompiledGraph create_react_agent(std::shared_ptr<const ChatModel> model,
                                 std::shared_ptr<const ToolRegistry> tools,
                                 const ReactAgentOptions& options) {
    if (!tools) {
        tools = std::make_shared<const ToolRegistry>();
    }

    StateGraph graph(message_state_schema());
    graph.add_node("agent", std::make_shared<ChatModelNode>(std::move(model), tools->definitions(), options.system_prompt))
         .add_node("tools", std::make_shared<ToolNode>(tools))
         .set_entry_point("agent")
         .add_conditional_edges("agent", route_tool_calls, {{"tools", "tools"}, {END, END}})
         .add_edge("tools", "agent")
         .interrupt_before(options.interrupt_before)
         .interrupt_after(options.interrupt_after);
    return graph.compile(options.checkpointer);
}

std::string handoff_tool_name(const std::string& agent) {
    return HANDOFF_PREFIX + agent;
}

ToolDefinition create_handoff_tool(const std::string& agent, const std::string& description) {
    ToolDefinition definition;
    definition.name = handoff_tool_name(agent);
    definition.description = description.empty()
        ? "Transfer the conversation to the '" + agent + "' agent."
        : description;
    return definition;
}

std::optional<std::string> find_handoff_target(const Value& msg, const std::vector<std::string>& agents) {
    for (const auto& call : message::tool_calls(msg)) {
        if (auto agent = handoff_agent(call.name, agents)) {
            return agent;
        }
    }
    return std::nullopt;
}

CompiledGraph create_supervisor(std::shared_ptr<const ChatModel> model,
                                std::vector<std::pair<std::string, CompiledGraph>> agents,
                                const SupervisorOptions& options) {
    if (agents.empty()) {
        throw GraphError("supervisor requires at least one agent");
    }

    std::vector<std::string> names;
    std::vector<ToolDefinition> handoff_tools;
    for (const auto& [name, _] : agents) {
        names.push_back(name);
        handoff_tools.push_back(create_handoff_tool(name));
    }
    check_agent_names(names, "supervisor", "supervisor");

    std::string prompt = InjaTemplateRenderer::render(options.system_prompt.value_or(DEFAULT_SUPERVISOR_PROMPT),
                                                      Context{{"agents", names}});

    StateGraph graph(message_state_schema());
    graph.add_node("supervisor", std::make_shared<SupervisorNode>(
                       ChatModelNode(std::move(model), std::move(handoff_tools), prompt), names))
         .set_entry_point("supervisor");
    for (auto& [name, agent_graph] : agents) {
        graph.add_node(name, std::make_shared<SubgraphNode>(std::move(agent_graph)))
             .add_edge(name, "supervisor");
    }
    return graph.compile(options.checkpointer);
}

CompiledGraph create_swarm(std::vector<SwarmAgent> agents, const SwarmOptions& options) {
    if (agents.empty()) {
        throw GraphError("swarm requires at least one agent");
    }

    std::vector<std::string> names;
    for (const auto& agent : agents) {
        names.push_back(agent.name);
    }
    check_agent_names(names, "swarm", "");

    StateGraph graph(message_state_schema());
    for (const auto& agent : agents) {
        std::vector<std::string> peers;
        std::copy_if(names.begin(), names.end(), std::back_inserter(peers),
                     [&agent](const std::string& n) { return n != agent.name; });

        CompiledGraph member = build_swarm_member(agent, peers);
        graph.add_node(agent.name, std::make_shared<SwarmAgentNode>(agent.name, std::move(member), peers, agent.tools));
    }
    graph.set_entry_point(names.front());
    return graph.compile(options.checkpointer);
}

} // namespace graphflow
