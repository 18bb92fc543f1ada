// engine/graph_stream.cpp
#include "graphflow/engine/graph_stream.h"
#include "engine/execution_run.h"
#include <stdexcept>

namespace graphflow {

GraphStream::GraphStream(std::unique_ptr<ExecutionRun> run) : run_(std::move(run)) {}

GraphStream::~GraphStream() = default;
GraphStream::GraphStream(GraphStream&&) noexcept = default;
GraphStream& GraphStream::operator=(GraphStream&&) noexcept = default;

std::optional<GraphEvent> GraphStream::next() {
    if (!run_ || failed_) {
        return std::nullopt;
    }
    try {
        return run_->next();
    } catch (const std::exception&) {
        failed_ = true;
        throw;
    }
}

bool GraphStream::done() const {
    return !run_ || failed_ || run_->exhausted();
}

const GraphResult& GraphStream::result() const {
    if (failed_) {
        throw std::logic_error("GraphStream::result() called after the run failed");
    }
    if (!run_ || !run_->finished()) {
        throw std::logic_error("GraphStream::result() called before the stream was exhausted");
    }
    return run_->result();
}

const std::vector<TraceRecord>& GraphStream::traces() const {
    static const std::vector<TraceRecord> none;
    return run_ ? run_->traces() : none;
}

void GraphStream::iterator::advance() {
    current_ = stream_ ? stream_->next() : std::optional<GraphEvent>();
    if (!current_) {
        stream_ = nullptr;
    }
}

} // namespace graphflow
