// config/engine_config.cpp
#include "graphflow/config/engine_config.h"
#include "graphflow/checkpoint/file_checkpointer.h"
#include "graphflow/checkpoint/memory_checkpointer.h"
#include "graphflow/common/yaml_json.h"
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace graphflow {

namespace {

std::string require_string(const Context& value, const std::string& key) {
    if (!value.is_string()) {
        throw std::runtime_error("Config key '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

int64_t require_non_negative(const Context& value, const std::string& key) {
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw std::runtime_error("Config key '" + key + "' must be a non-negative integer");
    }
    return value.get<int64_t>();
}

} // namespace

EngineConfig parse_engine_config(const Context& doc, const std::string& base_dir) {
    EngineConfig config;
    if (doc.is_null()) {
        return config;
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Engine config must be a mapping");
    }

    try {
        if (doc.contains("log_level")) {
            config.log_level = parse_log_level(require_string(doc["log_level"], "log_level"));
        }
        if (doc.contains("stream_mode")) {
            config.stream_mode = parse_stream_mode(require_string(doc["stream_mode"], "stream_mode"));
        }
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid engine config: ") + e.what());
    }

    if (doc.contains("checkpointer")) {
        const Context& cp = doc["checkpointer"];
        if (!cp.is_object()) {
            throw std::runtime_error("Config key 'checkpointer' must be a mapping");
        }
        if (cp.contains("backend")) {
            config.checkpointer_backend = require_string(cp["backend"], "checkpointer.backend");
            if (config.checkpointer_backend != "memory" && config.checkpointer_backend != "file" &&
                config.checkpointer_backend != "none") {
                throw std::runtime_error("Unknown checkpointer backend '" + config.checkpointer_backend + "'");
            }
        }
        if (cp.contains("directory")) {
            config.checkpoint_directory = require_string(cp["directory"], "checkpointer.directory");
        }
        if (cp.contains("max_per_thread")) {
            config.max_checkpoints_per_thread =
                static_cast<size_t>(require_non_negative(cp["max_per_thread"], "checkpointer.max_per_thread"));
        }
        if (cp.contains("ttl_seconds")) {
            config.checkpoint_ttl_seconds = require_non_negative(cp["ttl_seconds"], "checkpointer.ttl_seconds");
        }
    }

    // 相对路径按配置文件所在目录解析
    std::filesystem::path dir(config.checkpoint_directory);
    if (dir.is_relative() && !base_dir.empty()) {
        config.checkpoint_directory = (std::filesystem::path(base_dir) / dir).lexically_normal().string();
    }
    return config;
}

EngineConfig load_engine_config(const std::string& config_path) {
    namespace fs = std::filesystem;

    if (!fs::exists(config_path)) {
        logger().debug("No engine config at '" + config_path + "', using defaults");
        return EngineConfig{};
    }

    Context doc;
    try {
        // YAML 是 JSON 的超集，两种格式都可以
        doc = yaml_to_json(YAML::LoadFile(config_path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot parse engine config '" + config_path + "': " + e.what());
    }

    fs::path config_dir = fs::path(config_path).parent_path();
    return parse_engine_config(doc, config_dir.string());
}

void apply_engine_config(const EngineConfig& config) {
    logger().set_level(config.log_level);
}

std::shared_ptr<Checkpointer> make_checkpointer(const EngineConfig& config) {
    if (config.checkpointer_backend == "none") {
        return nullptr;
    }
    if (config.checkpointer_backend == "file") {
        FileCheckpointer::Options options;
        options.ttl = std::chrono::seconds(config.checkpoint_ttl_seconds);
        options.max_per_thread = config.max_checkpoints_per_thread;
        return std::make_shared<FileCheckpointer>(config.checkpoint_directory, options);
    }
    if (config.checkpointer_backend == "memory") {
        MemoryCheckpointer::Options options;
        options.max_per_thread = config.max_checkpoints_per_thread;
        return std::make_shared<MemoryCheckpointer>(options);
    }
    throw std::runtime_error("Unknown checkpointer backend '" + config.checkpointer_backend + "'");
}

} // namespace graphflow
