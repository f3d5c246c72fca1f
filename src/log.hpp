#pragma once

#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error };

void set_log_level(LogLevel level);
void set_log_level_from_string(const std::string& level);
LogLevel log_level();

// Tagged console logging. Debug/Info go to stdout, Warn/Error to stderr.
void log_debug(const std::string& tag, const std::string& msg);
void log_info(const std::string& tag, const std::string& msg);
void log_warn(const std::string& tag, const std::string& msg);
void log_error(const std::string& tag, const std::string& msg);

std::string format_mb(unsigned long long bytes);
