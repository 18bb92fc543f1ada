// graphflow/common/types.h
#ifndef GRAPHFLOW_COMMON_TYPES_H
#define GRAPHFLOW_COMMON_TYPES_H

#include <nlohmann/json.hpp>
#include <string>

namespace graphflow {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;
using Context = nlohmann::json;

using NodeName = std::string;
using ThreadId = std::string;
using CheckpointId = std::string;

// Sentinels. Never registered as nodes.
inline constexpr const char* START = "__start__";
inline constexpr const char* END = "__end__";

} // namespace graphflow

#endif // GRAPHFLOW_COMMON_TYPES_H
