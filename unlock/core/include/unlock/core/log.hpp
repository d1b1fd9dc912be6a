#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace unlock::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void log_message(LogLevel level, std::string_view category, const std::string& message);

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

const char* log_level_name(LogLevel level);
bool parse_log_level(std::string_view name, LogLevel& out);

// ============================================================================
// Formatted Logging
// ============================================================================

template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    log_message(level, {}, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_debug(std::string_view category, std::format_string<Args...> fmt, Args&&... args) {
    log_message(LogLevel::Debug, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_info(std::string_view category, std::format_string<Args...> fmt, Args&&... args) {
    log_message(LogLevel::Info, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_warning(std::string_view category, std::format_string<Args...> fmt, Args&&... args) {
    log_message(LogLevel::Warn, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_error(std::string_view category, std::format_string<Args...> fmt, Args&&... args) {
    log_message(LogLevel::Error, category, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace unlock::core
