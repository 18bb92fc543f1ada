// common/utils.cpp
#include "graphflow/common/utils.h"
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace graphflow {

std::string generate_id(const std::string& prefix) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << prefix << '-' << std::hex << std::setfill('0')
        << std::setw(16) << rng() << std::setw(16) << rng();
    return oss.str();
}

int64_t to_unix_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix_millis(int64_t millis) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = to_unix_millis(tp) % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace graphflow
