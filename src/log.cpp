#include "log.hpp"

#include <atomic>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

static std::atomic<LogLevel> gMinLevel{LogLevel::Info};
static std::mutex gLogMutex;

void set_log_level(LogLevel level) { gMinLevel = level; }

void set_log_level_from_string(const std::string& level) {
    std::string l;
    l.reserve(level.size());
    for (char c : level) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (l == "debug") gMinLevel = LogLevel::Debug;
    else if (l == "warn") gMinLevel = LogLevel::Warn;
    else if (l == "error") gMinLevel = LogLevel::Error;
    else gMinLevel = LogLevel::Info;
}

LogLevel log_level() { return gMinLevel; }

static const char* level_label(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

static void log_internal(LogLevel level, const std::string& tag, const std::string& msg) {
    if (level < gMinLevel) return;
    std::lock_guard<std::mutex> lk(gLogMutex);
    std::ostream& os = level >= LogLevel::Warn ? std::cerr : std::cout;
    os << "[" << level_label(level) << "][" << tag << "] " << msg << std::endl;
}

void log_debug(const std::string& tag, const std::string& msg) { log_internal(LogLevel::Debug, tag, msg); }
void log_info(const std::string& tag, const std::string& msg) { log_internal(LogLevel::Info, tag, msg); }
void log_warn(const std::string& tag, const std::string& msg) { log_internal(LogLevel::Warn, tag, msg); }
void log_error(const std::string& tag, const std::string& msg) { log_internal(LogLevel::Error, tag, msg); }

std::string format_mb(unsigned long long bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / 1024.0 / 1024.0) << " MB";
    return oss.str();
}
