#include "logger.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

using namespace std::chrono;

static std::mutex g_log_mutex;
static std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};

bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "debug") { out = LogLevel::Debug; return true; }
    if (s == "info") { out = LogLevel::Info; return true; }
    if (s == "warn") { out = LogLevel::Warn; return true; }
    if (s == "error") { out = LogLevel::Error; return true; }
    return false;
}

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load());
}

std::string now_iso8601() {
    auto now = system_clock::now();
    std::time_t t_c = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t_c, &tm);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setw(3) << std::setfill('0') << ms.count() << "Z";
    return oss.str();
}

static void log_line(LogLevel level, const char* tag, const std::string& msg) {
    if (static_cast<int>(level) < g_log_level.load()) return;
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::cerr << now_iso8601() << " [" << tag << "] " << msg << std::endl;
}

void log_debug(const std::string& msg) { log_line(LogLevel::Debug, "DEBUG", msg); }
void log_info(const std::string& msg) { log_line(LogLevel::Info, "INFO", msg); }
void log_warn(const std::string& msg) { log_line(LogLevel::Warn, "WARN", msg); }
void log_error(const std::string& msg) { log_line(LogLevel::Error, "ERROR", msg); }
