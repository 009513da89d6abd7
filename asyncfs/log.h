#ifndef ASYNCFS_LOG_H
#define ASYNCFS_LOG_H

#include <string>

namespace asyncfs {

enum class LogLevel { Debug, Info, Warn, Error };

bool parse_log_level(const std::string& text, LogLevel& out);
void set_log_level(LogLevel level);
LogLevel log_level();

// Writes one line to stderr. Lines from different threads never interleave.
void log(LogLevel level, const std::string& component, const std::string& message);

inline void log_debug(const std::string& component, const std::string& message) {
    log(LogLevel::Debug, component, message);
}
inline void log_info(const std::string& component, const std::string& message) {
    log(LogLevel::Info, component, message);
}
inline void log_warn(const std::string& component, const std::string& message) {
    log(LogLevel::Warn, component, message);
}
inline void log_error(const std::string& component, const std::string& message) {
    log(LogLevel::Error, component, message);
}

} // namespace asyncfs

#endif
