// graphflow/checkpoint/checkpoint.h
#ifndef GRAPHFLOW_CHECKPOINT_CHECKPOINT_H
#define GRAPHFLOW_CHECKPOINT_CHECKPOINT_H

#include "graphflow/common/types.h"
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace graphflow {

// Identifies a conversation thread and, optionally, a point in its history.
struct RunConfig {
    ThreadId thread_id;
    std::optional<CheckpointId> checkpoint_id;
    Value metadata = Value::object();   // merged into every checkpoint this run writes

    RunConfig() = default;
    explicit RunConfig(ThreadId thread) : thread_id(std::move(thread)) {}
    RunConfig(ThreadId thread, CheckpointId checkpoint)
        : thread_id(std::move(thread)), checkpoint_id(std::move(checkpoint)) {}
};

struct Checkpoint {
    ThreadId thread_id;
    CheckpointId checkpoint_id;
    Context state;
    NodeName next_node;                  // END when the thread finished
    std::optional<CheckpointId> parent_id;
    Value metadata = Value::object();    // source, step, reason[, paused]
    uint64_t sequence = 0;               // assigned by the checkpointer
    std::chrono::system_clock::time_point timestamp;

    // The interrupt this checkpoint is waiting on: "interrupt_before", "interrupt_after"
    // or "interrupt"; empty when the run was not paused here. update_state keeps the
    // pause of its base checkpoint under metadata "paused".
    std::string pause_reason() const;
    bool is_paused() const { return !pause_reason().empty(); }

    // Finished thread. A pause whose next hop is END is not terminal: resuming it completes.
    bool is_terminal() const { return next_node == END && !is_paused(); }
};

void to_json(nlohmann::json& j, const Checkpoint& checkpoint);
void from_json(const nlohmann::json& j, Checkpoint& checkpoint);

// 检查点存储接口。Implementations must be safe to call from several threads.
// put() is idempotent per (thread_id, checkpoint_id): re-putting replaces the
// data and keeps the original slot and sequence.
class Checkpointer {
public:
    virtual ~Checkpointer() = default;

    virtual void put(const Checkpoint& checkpoint) = 0;

    // Latest checkpoint (highest sequence) when `checkpoint_id` is empty.
    [[nodiscard]] virtual std::optional<Checkpoint> get(const ThreadId& thread_id,
                                                        const std::optional<CheckpointId>& checkpoint_id) const = 0;

    // Oldest to newest.
    [[nodiscard]] virtual std::vector<Checkpoint> list(const ThreadId& thread_id) const = 0;

    std::optional<Checkpoint> get_latest(const ThreadId& thread_id) const {
        return get(thread_id, std::nullopt);
    }
};

} // namespace graphflow

#endif // GRAPHFLOW_CHECKPOINT_CHECKPOINT_H
