// core/node.cpp
#include "graphflow/core/node.h"
#include <stdexcept>

namespace graphflow {

FunctionNode::FunctionNode(Function fn) : fn_(std::move(fn)) {
    if (!fn_) {
        throw std::invalid_argument("FunctionNode requires a callable");
    }
}

NodeOutput FunctionNode::process(const Context& state) const {
    return fn_(state);
}

} // namespace graphflow
