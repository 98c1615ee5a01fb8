#include "log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace xiangqi {
namespace {

static std::atomic<int> g_log_level{(int)LogLevel::Info};
static std::mutex g_log_mu;

static const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "?";
}

} // namespace

void set_log_level(LogLevel level) { g_log_level.store((int)level, std::memory_order_relaxed); }

LogLevel log_level() { return (LogLevel)g_log_level.load(std::memory_order_relaxed); }

LogLevel parse_log_level(const std::string& name) {
    std::string s = name;
    for (char& ch : s) ch = (char)std::tolower((unsigned char)ch);
    if (s == "debug") return LogLevel::Debug;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "off" || s == "none") return LogLevel::Off;
    return LogLevel::Info;
}

void log_line(LogLevel level, const char* tag, const std::string& msg) {
    if ((int)level < g_log_level.load(std::memory_order_relaxed)) return;
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << "[" << tag << "] ";
    if (level != LogLevel::Info) std::cerr << level_tag(level) << ": ";
    std::cerr << msg << "\n";
}

} // namespace xiangqi
