#pragma once
/**
 * @file logging.hpp
 * @brief Tagged console logging
 *
 * Info and debug lines go to stdout as "[component] message"; warnings and
 * errors go to stderr as "[WARNING] [component] message".
 */

#include <sstream>
#include <string>

namespace maxwell {

enum class LogLevel {
    Error = 0,
    Warning = 1,
    Info = 2,
    Debug = 3
};

void set_log_level(LogLevel level);

LogLevel log_level();

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(log_level());
}

void log_message(LogLevel level, const char* component, const std::string& message);

}  // namespace maxwell

// Stream-style logging; the message expression is only evaluated when enabled
#define MAXWELL_LOG(level, component, expr)                                   \
    do {                                                                      \
        if (::maxwell::log_enabled(level)) {                                  \
            std::ostringstream maxwell_log_stream_;                           \
            maxwell_log_stream_ << expr;                                      \
            ::maxwell::log_message(level, component, maxwell_log_stream_.str()); \
        }                                                                     \
    } while (0)

#define MAXWELL_LOG_DEBUG(component, expr) MAXWELL_LOG(::maxwell::LogLevel::Debug, component, expr)
#define MAXWELL_LOG_INFO(component, expr) MAXWELL_LOG(::maxwell::LogLevel::Info, component, expr)
#define MAXWELL_LOG_WARNING(component, expr) MAXWELL_LOG(::maxwell::LogLevel::Warning, component, expr)
#define MAXWELL_LOG_ERROR(component, expr) MAXWELL_LOG(::maxwell::LogLevel::Error, component, expr)
