// graphflow/engine/graph_result.h
#ifndef GRAPHFLOW_ENGINE_GRAPH_RESULT_H
#define GRAPHFLOW_ENGINE_GRAPH_RESULT_H

#include "graphflow/common/types.h"
#include "graphflow/engine/trace_exporter.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace graphflow {

enum class GraphStatus : uint8_t {
    COMPLETE,
    INTERRUPTED
};

enum class StreamMode : uint8_t {
    VALUES,   // full state after each node
    UPDATES   // the delta each node produced
};

// "values" / "updates"; throws std::invalid_argument otherwise
StreamMode parse_stream_mode(const std::string& name);

struct GraphEvent {
    NodeName node;
    Context payload;
};

// 一次调用的结果。中断不是错误，通过 status 表达
struct GraphResult {
    GraphStatus status = GraphStatus::COMPLETE;
    Context state;
    std::optional<NodeName> next_node;   // set when INTERRUPTED
    std::optional<Value> interrupt_value;
    std::vector<TraceRecord> traces;

    bool is_complete() const { return status == GraphStatus::COMPLETE; }
    bool is_interrupted() const { return status == GraphStatus::INTERRUPTED; }
};

} // namespace graphflow

#endif // GRAPHFLOW_ENGINE_GRAPH_RESULT_H
