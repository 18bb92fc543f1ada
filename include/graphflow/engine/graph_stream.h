// graphflow/engine/graph_stream.h
#ifndef GRAPHFLOW_ENGINE_GRAPH_STREAM_H
#define GRAPHFLOW_ENGINE_GRAPH_STREAM_H

#include "graphflow/engine/graph_result.h"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

namespace graphflow {

class ExecutionRun;

// Lazy, single-pass sequence of per-node events. Nodes run as events are
// pulled; errors surface from next(). result() is available once next() has
// returned std::nullopt.
//
//   auto stream = app.stream(input, StreamMode::UPDATES);
//   for (const GraphEvent& event : stream) { ... }
//   const GraphResult& result = stream.result();
class GraphStream {
public:
    explicit GraphStream(std::unique_ptr<ExecutionRun> run);
    ~GraphStream();
    GraphStream(GraphStream&&) noexcept;
    GraphStream& operator=(GraphStream&&) noexcept;
    GraphStream(const GraphStream&) = delete;
    GraphStream& operator=(const GraphStream&) = delete;

    std::optional<GraphEvent> next();
    bool done() const;

    // Throws std::logic_error before exhaustion or after a failed run.
    const GraphResult& result() const;

    // Records of the nodes run so far; still readable after next() threw.
    const std::vector<TraceRecord>& traces() const;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = GraphEvent;
        using difference_type = std::ptrdiff_t;
        using pointer = const GraphEvent*;
        using reference = const GraphEvent&;

        iterator() = default;
        explicit iterator(GraphStream* stream) : stream_(stream) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance(); return *this; }
        void operator++(int) { advance(); }

        bool operator==(const iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        GraphStream* stream_ = nullptr;
        std::optional<GraphEvent> current_;

        void advance();
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::unique_ptr<ExecutionRun> run_;
    bool failed_ = false;
};

} // namespace graphflow

#endif // GRAPHFLOW_ENGINE_GRAPH_STREAM_H
