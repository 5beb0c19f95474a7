#include "../include/log.hpp"
#include "../include/util.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::mutex g_log_mtx;

std::atomic<int>& level_slot() {
    static std::atomic<int> level{(int)parse_log_level(getenv_or("LOG_LEVEL", "info"))};
    return level;
}

void write_line(LogLevel level, const std::string& tag, const std::string& msg) {
    if ((int)level < level_slot().load()) return;
    std::lock_guard<std::mutex> lock(g_log_mtx);
    std::ostream& os = (level == LogLevel::Error) ? std::cerr : std::cout;
    os << "[" << tag << "] ";
    if (level == LogLevel::Warn) os << "WARN ";
    else if (level == LogLevel::Error) os << "ERROR ";
    os << msg << std::endl;
}
}

void set_log_level(LogLevel level) { level_slot().store((int)level); }

LogLevel log_level() { return (LogLevel)level_slot().load(); }

LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void log_debug(const std::string& tag, const std::string& msg) { write_line(LogLevel::Debug, tag, msg); }
void log_info(const std::string& tag, const std::string& msg) { write_line(LogLevel::Info, tag, msg); }
void log_warn(const std::string& tag, const std::string& msg) { write_line(LogLevel::Warn, tag, msg); }
void log_error(const std::string& tag, const std::string& msg) { write_line(LogLevel::Error, tag, msg); }
