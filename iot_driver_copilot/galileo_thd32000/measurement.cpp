#include "measurement.h"

#include <ctime>
#include <sstream>

size_t record_width(RecordFormat format) {
    return format == RecordFormat::Stamped ? 8 : 4;
}

std::string status_to_string(uint8_t status) {
    if (status == kStatusOk) return "ok";
    std::string out;
    auto add = [&out](const char* token) {
        if (!out.empty()) out += "|";
        out += token;
    };
    if (status & kStatusTempFault) add("temp_fault");
    if (status & kStatusHumidityFault) add("hum_fault");
    if (status & kStatusTimestampMismatch) add("ts_mismatch");
    return out;
}

bool parse_status(const std::string& text, uint8_t& status) {
    status = kStatusOk;
    if (text == "ok") return true;
    std::istringstream iss(text);
    std::string token;
    bool any = false;
    while (std::getline(iss, token, '|')) {
        if (token == "temp_fault") status |= kStatusTempFault;
        else if (token == "hum_fault") status |= kStatusHumidityFault;
        else if (token == "ts_mismatch") status |= kStatusTimestampMismatch;
        else return false;
        any = true;
    }
    return any;
}

std::string format_timestamp(int64_t ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

bool parse_timestamp(const std::string& text, int64_t& ts) {
    std::tm tm{};
    const char* end = strptime(text.c_str(), "%Y-%m-%d %H:%M:%S", &tm);
    if (end == nullptr || *end != '\0') return false;
    ts = (int64_t)timegm(&tm);
    return true;
}
