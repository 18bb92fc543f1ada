// checkpoint/checkpoint.cpp
#include "graphflow/checkpoint/checkpoint.h"
#include "graphflow/common/errors.h"
#include "graphflow/common/utils.h"

namespace graphflow {

namespace {

bool is_pause(const std::string& reason) {
    return reason == "interrupt_before" || reason == "interrupt_after" || reason == "interrupt";
}

} // namespace

std::string Checkpoint::pause_reason() const {
    if (!metadata.is_object()) {
        return "";
    }
    std::string reason = metadata.value("reason", std::string());
    if (is_pause(reason)) {
        return reason;
    }
    if (reason == "update_state") {
        std::string paused = metadata.value("paused", std::string());
        return is_pause(paused) ? paused : "";
    }
    return "";
}

void to_json(nlohmann::json& j, const Checkpoint& checkpoint) {
    j = nlohmann::json{
        {"thread_id", checkpoint.thread_id},
        {"checkpoint_id", checkpoint.checkpoint_id},
        {"state", checkpoint.state},
        {"next_node", checkpoint.next_node},
        {"parent_id", checkpoint.parent_id ? nlohmann::json(*checkpoint.parent_id) : nlohmann::json(nullptr)},
        {"metadata", checkpoint.metadata},
        {"sequence", checkpoint.sequence},
        {"timestamp", to_unix_millis(checkpoint.timestamp)}
    };
}

void from_json(const nlohmann::json& j, Checkpoint& checkpoint) {
    try {
        j.at("thread_id").get_to(checkpoint.thread_id);
        j.at("checkpoint_id").get_to(checkpoint.checkpoint_id);
        checkpoint.state = j.at("state");
        j.at("next_node").get_to(checkpoint.next_node);
        const auto& parent = j.value("parent_id", nlohmann::json(nullptr));
        checkpoint.parent_id = parent.is_null() ? std::nullopt : std::optional<CheckpointId>(parent.get<CheckpointId>());
        checkpoint.metadata = j.value("metadata", nlohmann::json::object());
        checkpoint.sequence = j.value("sequence", uint64_t{0});
        checkpoint.timestamp = from_unix_millis(j.value("timestamp", int64_t{0}));
    } catch (const nlohmann::json::exception& e) {
        throw CheckpointError(std::string("Malformed checkpoint record: ") + e.what());
    }
}

} // namespace graphflow
