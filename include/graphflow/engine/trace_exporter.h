// graphflow/engine/trace_exporter.h
#ifndef GRAPHFLOW_ENGINE_TRACE_EXPORTER_H
#define GRAPHFLOW_ENGINE_TRACE_EXPORTER_H

#include "graphflow/common/types.h"
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace graphflow {

struct TraceRecord {
    std::string trace_id;
    NodeName node;
    int step = 0;                  // iteration in which the node ran
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status;            // "running", "success", "failed", "interrupted"
    std::optional<std::string> error;
    Context delta;                 // update the node produced
    bool fan_out = false;          // ran as a Send target
};

void to_json(nlohmann::json& j, const TraceRecord& record);

// JSON array of records, the layout written to execution_trace.json.
nlohmann::json traces_to_json(const std::vector<TraceRecord>& traces);

// 每次调用的执行轨迹，一个节点一条记录
class TraceExporter {
public:
    explicit TraceExporter(std::string trace_id = "t-default");

    // Returns the record index to pass to on_node_end.
    size_t on_node_start(const NodeName& node, int step, bool fan_out = false);
    void on_node_end(size_t record,
                     const std::string& status,
                     const std::optional<std::string>& error,
                     const Context& delta);

    const std::vector<TraceRecord>& get_traces() const { return traces_; }

private:
    std::vector<TraceRecord> traces_;
    std::string trace_id_;
};

} // namespace graphflow

#endif // GRAPHFLOW_ENGINE_TRACE_EXPORTER_H
