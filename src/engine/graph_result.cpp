// engine/graph_result.cpp
#include "graphflow/engine/graph_result.h"
#include <stdexcept>

namespace graphflow {

StreamMode parse_stream_mode(const std::string& name) {
    if (name == "values") return StreamMode::VALUES;
    if (name == "updates") return StreamMode::UPDATES;
    throw std::invalid_argument("Unknown stream mode '" + name + "'");
}

} // namespace graphflow
