#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <vector>

#include "logger.h"

struct Config {
    // HTTP
    std::string http_host;
    int http_port;

    // Serial
    std::string serial_port;        // "auto" scans
    std::vector<int> baud_rates;    // preference order
    int probe_timeout_ms;
    int frame_timeout_ms;

    bool simulation;
    std::string export_dir;
    LogLevel log_level;

    bool autoDetectPort() const { return serial_port == "auto"; }
};

// Reads the environment; missing variables take their defaults. Throws
// std::runtime_error on malformed or out-of-range values.
Config load_config_from_env();

// Parses "9600,19200". Throws std::runtime_error on bad or unsupported rates.
std::vector<int> parse_baud_list(const std::string& s);

// Accepts 1/0, true/false, yes/no. Throws std::runtime_error otherwise.
bool parse_bool_setting(const std::string& s, const char* name);

std::string describe_config(const Config& cfg);

#endif // CONFIG_H
