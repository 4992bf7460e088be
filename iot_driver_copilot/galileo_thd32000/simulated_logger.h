#ifndef SIMULATED_LOGGER_H
#define SIMULATED_LOGGER_H

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "measurement.h"
#include "serial_link.h"

constexpr const char* kSimulatedPort = "sim";
constexpr int kSimulatedBaud = 9600;

struct SimulationProfile {
    double nominal_temperature = 20.0;
    double nominal_humidity = 60.0;
    uint32_t record_count = 100;
    uint32_t interval_seconds = 15 * 60;
    int64_t start_timestamp = 0;   // 0: four hours before now
    uint32_t seed = 1;
};

// In-process THD 32000: answers probe, header and block commands like the
// firmware does. Silent at any baud rate other than kSimulatedBaud.
class SimulatedLogger : public SerialLink {
public:
    SimulatedLogger(const SimulationProfile& profile, int baud);

    bool isOpen() const override { return open_; }
    void closePort() override;
    bool writeAll(const uint8_t* data, size_t len) override;
    int readSome(uint8_t* buf, size_t max, int timeout_ms) override;
    void flushInput() override { pending_.clear(); }
    std::string lastError() const override { return last_error_; }

    const DeviceInfo& deviceInfo() const { return info_; }
    const std::vector<int16_t>& temperatures() const { return temp_raw_; }

private:
    void respond(const std::vector<uint8_t>& bytes);

    DeviceInfo info_;
    std::vector<int16_t> temp_raw_;
    std::vector<uint16_t> hum_raw_;
    std::deque<uint8_t> pending_;
    std::vector<uint8_t> cmd_;
    bool open_;
    bool answering_;
    std::string last_error_;
};

class SimulatedLoggerOpener : public LinkOpener {
public:
    explicit SimulatedLoggerOpener(const SimulationProfile& profile) : profile_(profile) {}
    std::unique_ptr<SerialLink> open(const std::string& port, int baud, std::string& error) override;

private:
    SimulationProfile profile_;
};

#endif // SIMULATED_LOGGER_H
