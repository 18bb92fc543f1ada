// graphflow/common/errors.h
#ifndef GRAPHFLOW_COMMON_ERRORS_H
#define GRAPHFLOW_COMMON_ERRORS_H

#include "graphflow/common/types.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace graphflow {

// 所有引擎错误的基类
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& message) : std::runtime_error(message) {}
};

// compile() 收集全部违规后一次性抛出
class CompileError : public GraphError {
public:
    explicit CompileError(std::vector<std::string> violations);

    const std::vector<std::string>& violations() const { return violations_; }

private:
    std::vector<std::string> violations_;

    static std::string format(const std::vector<std::string>& violations);
};

class NodeError : public GraphError {
public:
    NodeError(NodeName node, const std::string& cause);

    const NodeName& node() const { return node_; }
    const std::string& cause() const { return cause_; }

private:
    NodeName node_;
    std::string cause_;
};

class RoutingError : public GraphError {
public:
    using GraphError::GraphError;
};

class IterationLimitExceeded : public GraphError {
public:
    explicit IterationLimitExceeded(int limit);

    int limit() const { return limit_; }

private:
    int limit_;
};

// Storage failures, missing checkpointer, or an unknown checkpoint id.
class CheckpointError : public GraphError {
public:
    using GraphError::GraphError;
};

// Raised by StateSchema when a field's strategy rejects an update.
class StateMergeError : public GraphError {
public:
    using GraphError::GraphError;
};

} // namespace graphflow

#endif // GRAPHFLOW_COMMON_ERRORS_H
