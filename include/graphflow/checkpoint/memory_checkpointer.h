// graphflow/checkpoint/memory_checkpointer.h
#ifndef GRAPHFLOW_CHECKPOINT_MEMORY_CHECKPOINTER_H
#define GRAPHFLOW_CHECKPOINT_MEMORY_CHECKPOINTER_H

#include "graphflow/checkpoint/checkpoint.h"
#include <cstddef>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace graphflow {

// In-process checkpointer: thread id -> checkpoints ordered by sequence.
class MemoryCheckpointer : public Checkpointer {
public:
    struct Options {
        size_t max_per_thread = 0;   // 0 = unbounded; otherwise oldest evicted first
    };

    MemoryCheckpointer() = default;
    explicit MemoryCheckpointer(Options options) : options_(options) {}

    void put(const Checkpoint& checkpoint) override;
    [[nodiscard]] std::optional<Checkpoint> get(const ThreadId& thread_id,
                                                const std::optional<CheckpointId>& checkpoint_id) const override;
    [[nodiscard]] std::vector<Checkpoint> list(const ThreadId& thread_id) const override;

    size_t thread_count() const;
    void clear(const ThreadId& thread_id);

private:
    Options options_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<ThreadId, std::vector<Checkpoint>> threads_;
    std::unordered_map<ThreadId, uint64_t> next_sequence_;
};

} // namespace graphflow

#endif // GRAPHFLOW_CHECKPOINT_MEMORY_CHECKPOINTER_H
