#ifndef LOGGER_H
#define LOGGER_H

#include <string>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

// Parses "debug", "info", "warn" or "error". Returns false on anything else.
bool parse_log_level(const std::string& s, LogLevel& out);

void set_log_level(LogLevel level);
LogLevel log_level();

std::string now_iso8601();

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

#endif // LOGGER_H
