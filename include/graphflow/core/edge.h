// graphflow/core/edge.h
#ifndef GRAPHFLOW_CORE_EDGE_H
#define GRAPHFLOW_CORE_EDGE_H

#include "graphflow/common/types.h"
#include <functional>
#include <map>
#include <string>

namespace graphflow {

// Pure function of state. The label it returns is looked up in the path map
// when one is given, otherwise it is taken as the target node name.
using Router = std::function<std::string(const Context&)>;

struct Edge {
    NodeName source;
    NodeName target;
};

struct ConditionalEdge {
    NodeName source;
    Router router;
    std::map<std::string, NodeName> path_map;
};

} // namespace graphflow

#endif // GRAPHFLOW_CORE_EDGE_H
