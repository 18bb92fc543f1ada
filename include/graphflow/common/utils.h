// graphflow/common/utils.h
#ifndef GRAPHFLOW_COMMON_UTILS_H
#define GRAPHFLOW_COMMON_UTILS_H

#include <chrono>
#include <cstdint>
#include <string>

namespace graphflow {

// Random 128-bit hex id, e.g. "cp-3f9a...". Thread-safe.
std::string generate_id(const std::string& prefix);

int64_t to_unix_millis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_unix_millis(int64_t millis);

// ISO-8601 UTC with millisecond precision, used in traces
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace graphflow

#endif // GRAPHFLOW_COMMON_UTILS_H
