#pragma once
#include <functional>
#include <string>

namespace toolbridge {

enum class LogLevel {
    Trace, Debug, Info, Warning, Error, Off
};

using LogSink = std::function<void(LogLevel, const std::string&)>;

std::string log_level_to_string(LogLevel level);

/// Messages below this level are dropped. Defaults to Info.
void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();

/// Route log lines to `sink`. An empty sink restores the stderr default.
void set_log_sink(LogSink sink);

[[nodiscard]] bool log_enabled(LogLevel level);
void log_message(LogLevel level, const std::string& message);

} // namespace toolbridge

#define TOOLBRIDGE_LOG(level, msg)                                  \
    do {                                                            \
        if (::toolbridge::log_enabled(level)) {                     \
            ::toolbridge::log_message(level, msg);                  \
        }                                                           \
    } while (0)

#define TOOLBRIDGE_LOG_TRACE(msg) TOOLBRIDGE_LOG(::toolbridge::LogLevel::Trace, msg)
#define TOOLBRIDGE_LOG_DEBUG(msg) TOOLBRIDGE_LOG(::toolbridge::LogLevel::Debug, msg)
#define TOOLBRIDGE_LOG_INFO(msg)  TOOLBRIDGE_LOG(::toolbridge::LogLevel::Info, msg)
#define TOOLBRIDGE_LOG_WARN(msg)  TOOLBRIDGE_LOG(::toolbridge::LogLevel::Warning, msg)
#define TOOLBRIDGE_LOG_ERROR(msg) TOOLBRIDGE_LOG(::toolbridge::LogLevel::Error, msg)
