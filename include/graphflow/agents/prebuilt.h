// graphflow/agents/prebuilt.h
#ifndef GRAPHFLOW_AGENTS_PREBUILT_H
#define GRAPHFLOW_AGENTS_PREBUILT_H

#include "graphflow/agents/chat_model.h"
#include "graphflow/agents/message.h"
#include "graphflow/checkpoint/checkpoint.h"
#include "graphflow/core/compiled_graph.h"
#include "graphflow/tools/registry.h"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace graphflow {

// ---- ReAct: "agent" <-> "tools" until the model stops calling tools ----

struct ReactAgentOptions {
    std::shared_ptr<Checkpointer> checkpointer;
    std::vector<NodeName> interrupt_before;   // e.g. {"tools"} to approve tool calls
    std::vector<NodeName> interrupt_after;
    std::optional<std::string> system_prompt;
};

CompiledGraph create_react_agent(std::shared_ptr<const ChatModel> model,
                                 std::shared_ptr<const ToolRegistry> tools,
                                 const ReactAgentOptions& options = {});

// ---- Handoff ----

// "transfer_to_<agent>"
std::string handoff_tool_name(const std::string& agent);

// Description defaults to "Transfer the conversation to the '<agent>' agent."
ToolDefinition create_handoff_tool(const std::string& agent, const std::string& description = "");

// First tool call of `msg` that hands off to one of `agents`.
std::optional<std::string> find_handoff_target(const Value& msg, const std::vector<std::string>& agents);

// ---- Supervisor: one coordinator delegating to compiled sub-agents ----

struct SupervisorOptions {
    std::shared_ptr<Checkpointer> checkpointer;
    // Inja template; {{ agents }} is the list of agent names.
    std::optional<std::string> system_prompt;
};

CompiledGraph create_supervisor(std::shared_ptr<const ChatModel> model,
                                std::vector<std::pair<std::string, CompiledGraph>> agents,
                                const SupervisorOptions& options = {});

// ---- Swarm: peers handing the conversation to each other ----

struct SwarmAgent {
    std::string name;
    std::shared_ptr<const ChatModel> model;
    std::shared_ptr<const ToolRegistry> tools;   // may be null
    // Inja template; {{ agent }} and {{ peers }} are available.
    std::optional<std::string> system_prompt;
};

struct SwarmOptions {
    std::shared_ptr<Checkpointer> checkpointer;
};

// The first agent is the entry point.
CompiledGraph create_swarm(std::vector<SwarmAgent> agents, const SwarmOptions& options = {});

} // namespace graphflow

#endif // GRAPHFLOW_AGENTS_PREBUILT_H
