/**
 * @file logging.cpp
 * @brief Tagged console logging implementation
 */

#include "logging.hpp"

#include <atomic>
#include <iostream>

namespace maxwell {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogLevel::Warning)};

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::Error: return "[ERROR] ";
    case LogLevel::Warning: return "[WARNING] ";
    case LogLevel::Info: return "";
    case LogLevel::Debug: return "[debug] ";
    }
    return "";
}

}  // namespace

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load());
}

void log_message(LogLevel level, const char* component, const std::string& message) {
    if (!log_enabled(level)) {
        return;
    }

    std::ostream& out = level <= LogLevel::Warning ? std::cerr : std::cout;
    out << level_tag(level) << "[" << component << "] " << message << "\n";
}

}  // namespace maxwell
