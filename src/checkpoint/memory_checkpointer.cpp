// checkpoint/memory_checkpointer.cpp
#include "graphflow/checkpoint/memory_checkpointer.h"
#include "graphflow/common/errors.h"
#include <algorithm>
#include <mutex>

namespace graphflow {

void MemoryCheckpointer::put(const Checkpoint& checkpoint) {
    if (checkpoint.thread_id.empty()) {
        throw CheckpointError("Checkpoint thread_id must not be empty");
    }
    if (checkpoint.checkpoint_id.empty()) {
        throw CheckpointError("Checkpoint id must not be empty");
    }

    std::unique_lock lock(mutex_);
    auto& history = threads_[checkpoint.thread_id];

    auto it = std::find_if(history.begin(), history.end(), [&](const Checkpoint& c) {
        return c.checkpoint_id == checkpoint.checkpoint_id;
    });
    if (it != history.end()) {
        // 同一 id 重复写入：替换数据，保留原序号
        uint64_t sequence = it->sequence;
        *it = checkpoint;
        it->sequence = sequence;
        return;
    }

    Checkpoint stored = checkpoint;
    stored.sequence = ++next_sequence_[checkpoint.thread_id];
    history.push_back(std::move(stored));

    if (options_.max_per_thread > 0 && history.size() > options_.max_per_thread) {
        auto excess = static_cast<std::ptrdiff_t>(history.size() - options_.max_per_thread);
        history.erase(history.begin(), history.begin() + excess);
    }
}

std::optional<Checkpoint> MemoryCheckpointer::get(const ThreadId& thread_id,
                                                  const std::optional<CheckpointId>& checkpoint_id) const {
    std::shared_lock lock(mutex_);
    auto thread_it = threads_.find(thread_id);
    if (thread_it == threads_.end() || thread_it->second.empty()) {
        return std::nullopt;
    }
    const auto& history = thread_it->second;

    if (!checkpoint_id) {
        return history.back();
    }
    auto it = std::find_if(history.begin(), history.end(), [&](const Checkpoint& c) {
        return c.checkpoint_id == *checkpoint_id;
    });
    if (it == history.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<Checkpoint> MemoryCheckpointer::list(const ThreadId& thread_id) const {
    std::shared_lock lock(mutex_);
    auto thread_it = threads_.find(thread_id);
    if (thread_it == threads_.end()) {
        return {};
    }
    return thread_it->second;
}

size_t MemoryCheckpointer::thread_count() const {
    std::shared_lock lock(mutex_);
    return threads_.size();
}

void MemoryCheckpointer::clear(const ThreadId& thread_id) {
    std::unique_lock lock(mutex_);
    threads_.erase(thread_id);
    next_sequence_.erase(thread_id);
}

} // namespace graphflow
