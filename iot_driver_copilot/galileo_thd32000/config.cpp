#include "config.h"

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

#include "serial_port.h"

static std::string get_env_or(const char* key, const char* def) {
    const char* v = std::getenv(key);
    if (!v || std::string(v).empty()) return std::string(def);
    return std::string(v);
}

static long parse_long(const std::string& s, const char* name) {
    errno = 0;
    char* end = nullptr;
    long val = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') {
        throw std::runtime_error(std::string("Invalid integer for ") + name + ": " + s);
    }
    return val;
}

bool parse_bool_setting(const std::string& s, const char* name) {
    if (s == "1" || s == "true" || s == "yes") return true;
    if (s == "0" || s == "false" || s == "no") return false;
    throw std::runtime_error(std::string("Invalid boolean for ") + name + ": " + s);
}

std::vector<int> parse_baud_list(const std::string& s) {
    std::vector<int> out;
    std::istringstream iss(s);
    std::string item;
    while (std::getline(iss, item, ',')) {
        while (!item.empty() && item.front() == ' ') item.erase(item.begin());
        while (!item.empty() && item.back() == ' ') item.pop_back();
        if (item.empty()) continue;
        int baud = (int)parse_long(item, "BAUD_RATES");
        if (!is_supported_baud(baud)) {
            throw std::runtime_error("Unsupported baud rate in BAUD_RATES: " + item);
        }
        bool dup = false;
        for (int b : out) dup = dup || b == baud;
        if (!dup) out.push_back(baud);
    }
    if (out.empty()) throw std::runtime_error("BAUD_RATES must list at least one rate");
    return out;
}

Config load_config_from_env() {
    Config cfg{};

    cfg.http_host = get_env_or("HTTP_HOST", "127.0.0.1");
    cfg.http_port = (int)parse_long(get_env_or("HTTP_PORT", "5000"), "HTTP_PORT");
    if (cfg.http_port <= 0 || cfg.http_port > 65535) {
        throw std::runtime_error("HTTP_PORT out of range");
    }

    cfg.serial_port = get_env_or("SERIAL_PORT", "auto");
    cfg.baud_rates = parse_baud_list(get_env_or("BAUD_RATES", "9600,19200,38400,57600,115200"));

    cfg.probe_timeout_ms = (int)parse_long(get_env_or("PROBE_TIMEOUT_MS", "500"), "PROBE_TIMEOUT_MS");
    cfg.frame_timeout_ms = (int)parse_long(get_env_or("FRAME_TIMEOUT_MS", "1500"), "FRAME_TIMEOUT_MS");
    if (cfg.probe_timeout_ms <= 0) throw std::runtime_error("PROBE_TIMEOUT_MS must be > 0");
    if (cfg.frame_timeout_ms <= 0) throw std::runtime_error("FRAME_TIMEOUT_MS must be > 0");

    cfg.simulation = parse_bool_setting(get_env_or("SIMULATION", "0"), "SIMULATION");
    cfg.export_dir = get_env_or("EXPORT_DIR", "./historial_lecturas");

    std::string level = get_env_or("LOG_LEVEL", "info");
    if (!parse_log_level(level, cfg.log_level)) {
        throw std::runtime_error("LOG_LEVEL must be one of debug/info/warn/error: " + level);
    }

    return cfg;
}

std::string describe_config(const Config& cfg) {
    std::ostringstream oss;
    oss << "Config loaded: HTTP " << cfg.http_host << ":" << cfg.http_port
        << ", Serial " << (cfg.simulation ? std::string("simulated") : cfg.serial_port)
        << ", Baud";
    for (size_t i = 0; i < cfg.baud_rates.size(); ++i) {
        oss << (i == 0 ? " " : ",") << cfg.baud_rates[i];
    }
    oss << ", Probe timeout " << cfg.probe_timeout_ms << "ms"
        << ", Frame timeout " << cfg.frame_timeout_ms << "ms"
        << ", Export dir " << cfg.export_dir;
    return oss.str();
}
