#ifndef MEASUREMENT_H
#define MEASUREMENT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class RecordFormat {
    Plain,    // temp(2) hum(2), THD 32000 native
    Stamped   // epoch(4) temp(2) hum(2)
};

size_t record_width(RecordFormat format);

struct DeviceInfo {
    uint32_t record_count = 0;
    uint32_t interval_seconds = 0;
    int64_t start_timestamp = 0;   // device clock, seconds since epoch (UTC-naive)
    std::string model;
    RecordFormat format = RecordFormat::Plain;
};

// Status flags carried by MeasurementRecord::status.
enum : uint8_t {
    kStatusOk = 0x00,
    kStatusTempFault = 0x01,
    kStatusHumidityFault = 0x02,
    kStatusTimestampMismatch = 0x04
};

struct MeasurementRecord {
    uint32_t index = 0;
    int64_t timestamp = 0;
    double temperature = 0.0;   // degC
    double humidity = 0.0;      // %rH
    uint8_t status = kStatusOk;

    bool temperatureFaulted() const { return (status & kStatusTempFault) != 0; }
    bool humidityFaulted() const { return (status & kStatusHumidityFault) != 0; }
};

// "ok", or the set flags joined with '|'.
std::string status_to_string(uint8_t status);

// Inverse of status_to_string. False on an unknown token.
bool parse_status(const std::string& text, uint8_t& status);

// "%Y-%m-%d %H:%M:%S" of a device-clock timestamp.
std::string format_timestamp(int64_t ts);
bool parse_timestamp(const std::string& text, int64_t& ts);

#endif // MEASUREMENT_H
