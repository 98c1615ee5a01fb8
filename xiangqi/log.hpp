#pragma once

#include <string>

namespace xiangqi {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_log_level(LogLevel level);
LogLevel log_level();
LogLevel parse_log_level(const std::string& name); // defaults to Info

// One "[tag] message" line on stderr.
void log_line(LogLevel level, const char* tag, const std::string& msg);

inline void log_debug(const char* tag, const std::string& msg) { log_line(LogLevel::Debug, tag, msg); }
inline void log_info(const char* tag, const std::string& msg) { log_line(LogLevel::Info, tag, msg); }
inline void log_warn(const char* tag, const std::string& msg) { log_line(LogLevel::Warn, tag, msg); }
inline void log_error(const char* tag, const std::string& msg) { log_line(LogLevel::Error, tag, msg); }

} // namespace xiangqi
