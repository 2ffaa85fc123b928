#include "toolbridge/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace toolbridge {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_sink_mutex;
LogSink g_sink;

} // anonymous namespace

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "trace";
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
        case LogLevel::Off:     return "off";
    }
    return "unknown";
}

void set_log_level(LogLevel level) {
    g_level = level;
}

LogLevel log_level() {
    return g_level;
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

bool log_enabled(LogLevel level) {
    return level != LogLevel::Off && level >= g_level.load();
}

void log_message(LogLevel level, const std::string& message) {
    if (!log_enabled(level)) return;

    // Reader, writer and watchdog threads all log; serialize the sink.
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(level, message);
        return;
    }
    std::cerr << "[toolbridge " << log_level_to_string(level) << "] " << message << "\n";
}

} // namespace toolbridge
