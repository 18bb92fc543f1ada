// graphflow/config/engine_config.h
#ifndef GRAPHFLOW_CONFIG_ENGINE_CONFIG_H
#define GRAPHFLOW_CONFIG_ENGINE_CONFIG_H

#include "graphflow/checkpoint/checkpoint.h"
#include "graphflow/common/logging.h"
#include "graphflow/common/types.h"
#include "graphflow/engine/graph_result.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace graphflow {

// graphflow.yaml:
//
//   log_level: info            # debug | info | warning | error | off
//   stream_mode: updates       # values | updates
//   checkpointer:
//     backend: file            # memory | file | none
//     directory: checkpoints   # relative to the config file
//     max_per_thread: 50
//     ttl_seconds: 86400
struct EngineConfig {
    LogLevel log_level = LogLevel::WARNING;
    StreamMode stream_mode = StreamMode::VALUES;
    std::string checkpointer_backend = "memory";
    std::string checkpoint_directory = ".graphflow/checkpoints";
    size_t max_checkpoints_per_thread = 0;
    int64_t checkpoint_ttl_seconds = 0;
};

// Missing file -> defaults. Malformed YAML/JSON or invalid values throw std::runtime_error.
EngineConfig load_engine_config(const std::string& config_path = "graphflow.yaml");

// `base_dir` anchors a relative checkpoint directory.
EngineConfig parse_engine_config(const Context& doc, const std::string& base_dir = "");

// Sets the global log level.
void apply_engine_config(const EngineConfig& config);

// nullptr for backend "none".
std::shared_ptr<Checkpointer> make_checkpointer(const EngineConfig& config);

} // namespace graphflow

#endif // GRAPHFLOW_CONFIG_ENGINE_CONFIG_H
