// engine/trace_exporter.cpp
#include "graphflow/engine/trace_exporter.h"
#include "graphflow/common/utils.h"

namespace graphflow {

void to_json(nlohmann::json& j, const TraceRecord& record) {
    j = nlohmann::json{
        {"trace_id", record.trace_id},
        {"node", record.node},
        {"step", record.step},
        {"start_time", format_timestamp(record.start_time)},
        {"end_time", format_timestamp(record.end_time)},
        {"duration_ms", std::chrono::duration_cast<std::chrono::milliseconds>(record.end_time - record.start_time).count()},
        {"status", record.status},
        {"delta", record.delta},
        {"fan_out", record.fan_out}
    };
    if (record.error) {
        j["error"] = *record.error;
    }
}

TraceExporter::TraceExporter(std::string trace_id) : trace_id_(std::move(trace_id)) {}

size_t TraceExporter::on_node_start(const NodeName& node, int step, bool fan_out) {
    TraceRecord record;
    record.trace_id = trace_id_;
    record.node = node;
    record.step = step;
    record.start_time = std::chrono::system_clock::now();
    record.end_time = record.start_time;
    record.status = "running";
    record.delta = Context::object();
    record.fan_out = fan_out;
    traces_.push_back(std::move(record));
    return traces_.size() - 1;
}

void TraceExporter::on_node_end(size_t record,
                                const std::string& status,
                                const std::optional<std::string>& error,
                                const Context& delta) {
    if (record >= traces_.size()) {
        return;
    }
    TraceRecord& entry = traces_[record];
    entry.end_time = std::chrono::system_clock::now();
    entry.status = status;
    entry.error = error;
    entry.delta = delta.is_null() ? Context::object() : delta;
}

nlohmann::json traces_to_json(const std::vector<TraceRecord>& traces) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& record : traces) {
        arr.push_back(record);
    }
    return arr;
}

} // namespace graphflow
