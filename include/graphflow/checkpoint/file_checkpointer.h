// graphflow/checkpoint/file_checkpointer.h
#ifndef GRAPHFLOW_CHECKPOINT_FILE_CHECKPOINTER_H
#define GRAPHFLOW_CHECKPOINT_FILE_CHECKPOINTER_H

#include "graphflow/checkpoint/checkpoint.h"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <unordered_map>

namespace graphflow {

// 每个线程一个 JSON 文件：<directory>/<thread>.json
// Survives process restarts. Calls on different threads never wait on each other. Files are rewritten through a temporary file and
// renamed into place, so a crash never leaves a half-written history.
class FileCheckpointer : public Checkpointer {
public:
    struct Options {
        std::chrono::seconds ttl{0};   // 0 = keep forever; older checkpoints are dropped on access
        size_t max_per_thread = 0;     // 0 = unbounded
    };

    explicit FileCheckpointer(std::filesystem::path directory);
    FileCheckpointer(std::filesystem::path directory, Options options);

    void put(const Checkpoint& checkpoint) override;
    [[nodiscard]] std::optional<Checkpoint> get(const ThreadId& thread_id,
                                                const std::optional<CheckpointId>& checkpoint_id) const override;
    [[nodiscard]] std::vector<Checkpoint> list(const ThreadId& thread_id) const override;

    const std::filesystem::path& directory() const { return directory_; }
    std::filesystem::path file_for(const ThreadId& thread_id) const;

private:
    struct ThreadFile {
        uint64_t next_sequence = 0;
        std::vector<Checkpoint> checkpoints;
    };

    std::filesystem::path directory_;
    Options options_;
    // One lock per thread file; locks_mutex_ only guards the map.
    mutable std::mutex locks_mutex_;
    mutable std::unordered_map<ThreadId, std::mutex> thread_locks_;

    std::mutex& lock_for(const ThreadId& thread_id) const;

    ThreadFile load(const ThreadId& thread_id) const;
    void store(const ThreadId& thread_id, const ThreadFile& file) const;
    void drop_expired(std::vector<Checkpoint>& checkpoints) const;
};

} // namespace graphflow

#endif // GRAPHFLOW_CHECKPOINT_FILE_CHECKPOINTER_H
