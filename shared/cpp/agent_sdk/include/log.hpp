#pragma once
#include <string>

enum class LogLevel { Debug, Info, Warn, Error };

// Initial level comes from LOG_LEVEL (debug|info|warn|error), default info.
void set_log_level(LogLevel level);
LogLevel log_level();
LogLevel parse_log_level(const std::string& s);

// Lines are written as "[tag] message"; errors go to stderr.
void log_debug(const std::string& tag, const std::string& msg);
void log_info(const std::string& tag, const std::string& msg);
void log_warn(const std::string& tag, const std::string& msg);
void log_error(const std::string& tag, const std::string& msg);
