#include "asyncfs/log.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace asyncfs {

// Mutex for thread-safe printing
static std::mutex print_mutex;
static std::atomic<int> threshold{static_cast<int>(LogLevel::Info)};

static const char *level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

bool parse_log_level(const std::string& text, LogLevel& out) {
    if (text == "debug") out = LogLevel::Debug;
    else if (text == "info") out = LogLevel::Info;
    else if (text == "warn") out = LogLevel::Warn;
    else if (text == "error") out = LogLevel::Error;
    else return false;
    return true;
}

void set_log_level(LogLevel level) {
    threshold.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(threshold.load());
}

void log(LogLevel level, const std::string& component, const std::string& message) {
    if (static_cast<int>(level) < threshold.load()) return;
    std::lock_guard<std::mutex> lock(print_mutex);
    std::cerr << "[" << level_name(level) << "] " << component << ": " << message << std::endl;
}

} // namespace asyncfs
