// graphflow/tools/registry.h
#ifndef GRAPHFLOW_TOOLS_REGISTRY_H
#define GRAPHFLOW_TOOLS_REGISTRY_H

#include "graphflow/common/types.h"
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace graphflow {

// What a chat model is told about a tool.
struct ToolDefinition {
    std::string name;
    std::string description;
    Value parameters = Value::object();   // JSON schema of the arguments
};

void to_json(nlohmann::json& j, const ToolDefinition& definition);

// 工具注册表：name -> JSON 函数。Register everything before sharing the
// registry between threads; lookups and calls are then read-only.
class ToolRegistry {
public:
    using ToolFunction = std::function<Value(const Value&)>;

    ToolRegistry() = default;

    template<typename Func>
    void register_tool(std::string name, std::string description, Func&& func,
                       Value parameters = Value::object()) {
        ToolDefinition definition{name, std::move(description), std::move(parameters)};
        tools_[std::move(name)] = Entry{std::move(definition), ToolFunction(std::forward<Func>(func))};
    }

    bool has_tool(const std::string& name) const;

    // Failures are reported as {"error": "..."} rather than thrown.
    Value call_tool(const std::string& name, const Value& args) const;

    std::vector<std::string> list_tools() const;
    std::vector<ToolDefinition> definitions() const;

private:
    struct Entry {
        ToolDefinition definition;
        ToolFunction function;
    };
    std::map<std::string, Entry> tools_;
};

} // namespace graphflow

#endif // GRAPHFLOW_TOOLS_REGISTRY_H
