// tools/registry.cpp
#include "graphflow/tools/registry.h"
#include "graphflow/common/logging.h"
#include <stdexcept>

namespace graphflow {

void to_json(nlohmann::json& j, const ToolDefinition& definition) {
    j = nlohmann::json{
        {"name", definition.name},
        {"description", definition.description},
        {"parameters", definition.parameters}
    };
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.count(name) > 0;
}

Value ToolRegistry::call_tool(const std::string& name, const Value& args) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return Value{{"error", "Tool not found: " + name}};
    }

    try {
        return it->second.function(args);
    } catch (const std::exception& e) {
        logger().warning("Tool '" + name + "' failed: " + e.what());
        return Value{{"error", std::string("Tool execution failed: ") + e.what()}};
    }
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    return names;
}

std::vector<ToolDefinition> ToolRegistry::definitions() const {
    std::vector<ToolDefinition> defs;
    defs.reserve(tools_.size());
    for (const auto& [_, entry] : tools_) {
        defs.push_back(entry.definition);
    }
    return defs;
}

} // namespace graphflow
