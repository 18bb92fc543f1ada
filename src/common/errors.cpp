// common/errors.cpp
#include "graphflow/common/errors.h"
#include <sstream>

namespace graphflow {

CompileError::CompileError(std::vector<std::string> violations)
    : GraphError(format(violations)), violations_(std::move(violations)) {}

std::string CompileError::format(const std::vector<std::string>& violations) {
    std::ostringstream oss;
    oss << "Graph compilation failed with " << violations.size() << " violation(s):";
    for (const auto& v : violations) {
        oss << "\n  - " << v;
    }
    return oss.str();
}

NodeError::NodeError(NodeName node, const std::string& cause)
    : GraphError("Node '" + node + "' failed: " + cause), node_(std::move(node)), cause_(cause) {}

IterationLimitExceeded::IterationLimitExceeded(int limit)
    : GraphError("Graph exceeded the iteration limit of " + std::to_string(limit) + " node executions"),
      limit_(limit) {}

} // namespace graphflow
