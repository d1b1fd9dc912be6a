#include <unlock/core/log.hpp>
#include <cstdio>
#include <vector>
#include <mutex>
#include <atomic>
#include <algorithm>

namespace unlock::core {

static std::atomic<LogLevel> s_log_level{LogLevel::Info};
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

void log(LogLevel level, const char* message) {
    log_message(level, {}, message ? std::string(message) : std::string());
}

void log_message(LogLevel level, std::string_view category, const std::string& message) {
    if (level < s_log_level.load()) return;

    std::string cat(category);
    if (cat.empty()) {
        std::printf("%s\n", message.c_str());
    } else {
        std::printf("[%s] %s\n", cat.c_str(), message.c_str());
    }

    // Forward to registered sinks
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, cat, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level.load();
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
        default:              return "unknown";
    }
}

bool parse_log_level(std::string_view name, LogLevel& out) {
    static constexpr LogLevel levels[] = {
        LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
        LogLevel::Warn, LogLevel::Error, LogLevel::Fatal
    };
    for (LogLevel level : levels) {
        if (name == log_level_name(level)) {
            out = level;
            return true;
        }
    }
    return false;
}

} // namespace unlock::core
