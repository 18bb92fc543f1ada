// common/logging.cpp
#include "graphflow/common/logging.h"
#include <iostream>
#include <stdexcept>

namespace graphflow {

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off") return LogLevel::OFF;
    throw std::invalid_argument("Unknown log level '" + name + "'");
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
    }
    return "UNKNOWN";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

bool Logger::enabled(LogLevel level) const {
    LogLevel threshold = level_.load();
    return threshold != LogLevel::OFF && level != LogLevel::OFF &&
           static_cast<uint8_t>(level) >= static_cast<uint8_t>(threshold);
}

void Logger::set_stream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = stream_ ? *stream_ : std::cerr;
    out << "[" << log_level_name(level) << "] " << message << std::endl;
}

} // namespace graphflow
