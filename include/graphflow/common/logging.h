// graphflow/common/logging.h
#ifndef GRAPHFLOW_COMMON_LOGGING_H
#define GRAPHFLOW_COMMON_LOGGING_H

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

namespace graphflow {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    OFF
};

// "debug" / "info" / "warning" / "error" / "off"; throws std::invalid_argument otherwise
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// 进程级日志器：按阈值过滤，输出 "[LEVEL] message" 行（默认 std::cerr）
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel level) const;

    // Redirects output; the stream must outlive its use. nullptr restores std::cerr.
    void set_stream(std::ostream* stream);

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::WARNING};
    std::ostream* stream_ = nullptr;
    std::mutex mutex_;
};

inline Logger& logger() { return Logger::instance(); }

} // namespace graphflow

#endif // GRAPHFLOW_COMMON_LOGGING_H
