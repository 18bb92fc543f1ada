// graphflow/common/yaml_json.h
#ifndef GRAPHFLOW_COMMON_YAML_JSON_H
#define GRAPHFLOW_COMMON_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace graphflow {

// 将 YAML::Node 转换为 nlohmann::json
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace graphflow

#endif // GRAPHFLOW_COMMON_YAML_JSON_H
