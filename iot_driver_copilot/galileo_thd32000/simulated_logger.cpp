#include "simulated_logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>

#include "galileo_protocol.h"

static const char kAckText[] = "THD32000 GALILEO";

SimulatedLogger::SimulatedLogger(const SimulationProfile& profile, int baud)
: open_(true), answering_(baud == kSimulatedBaud) {
    info_.record_count = std::min<uint32_t>(profile.record_count, (uint32_t)kMaxRecords);
    info_.interval_seconds = std::max<uint32_t>(60, profile.interval_seconds - profile.interval_seconds % 60);
    info_.model = "THD32000-SIM";
    info_.format = RecordFormat::Plain;
    if (profile.start_timestamp != 0) {
        info_.start_timestamp = profile.start_timestamp;
    } else {
        auto now = std::chrono::system_clock::now();
        int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
        info_.start_timestamp = secs - 4 * 3600;
    }

    std::mt19937 gen(profile.seed);
    std::uniform_real_distribution<double> temp_noise(-1.0, 1.0);
    std::uniform_real_distribution<double> hum_noise(-5.0, 10.0);
    temp_raw_.reserve(info_.record_count);
    hum_raw_.reserve(info_.record_count);
    for (uint32_t i = 0; i < info_.record_count; ++i) {
        double t = profile.nominal_temperature + temp_noise(gen);
        double h = std::min(100.0, std::max(0.1, profile.nominal_humidity + hum_noise(gen)));
        temp_raw_.push_back((int16_t)std::lround(t * 10.0));
        hum_raw_.push_back((uint16_t)std::lround(h * 10.0));
    }
}

void SimulatedLogger::closePort() {
    open_ = false;
    pending_.clear();
    cmd_.clear();
}

void SimulatedLogger::respond(const std::vector<uint8_t>& bytes) {
    if (answering_) pending_.insert(pending_.end(), bytes.begin(), bytes.end());
}

bool SimulatedLogger::writeAll(const uint8_t* data, size_t len) {
    if (!open_) { last_error_ = "serial not open"; return false; }
    cmd_.insert(cmd_.end(), data, data + len);

    while (!cmd_.empty()) {
        if (cmd_[0] == 0x5C) {
            respond(std::vector<uint8_t>(kAckText, kAckText + kAckFrameLen));
            cmd_.erase(cmd_.begin());
        } else if (cmd_[0] == 0xAD) {
            if (cmd_.size() < 2) break;
            if (cmd_[1] == 0xDA) respond(encode_header(info_));
            cmd_.erase(cmd_.begin(), cmd_.begin() + 2);
        } else if (cmd_[0] == 0xD3) {
            if (cmd_.size() < 5) break;
            if (cmd_[1] == 0xDA) {
                std::vector<uint8_t> block(kBlockFrameLen, 0xFF);
                size_t first = (size_t)cmd_[2] * kRecordsPerBlock;
                for (size_t i = 0; i < kRecordsPerBlock && first + i < info_.record_count; ++i) {
                    uint16_t t = (uint16_t)temp_raw_[first + i];
                    uint16_t h = hum_raw_[first + i];
                    block[i * 4 + 0] = (uint8_t)(t >> 8);
                    block[i * 4 + 1] = (uint8_t)(t & 0xFF);
                    block[i * 4 + 2] = (uint8_t)(h >> 8);
                    block[i * 4 + 3] = (uint8_t)(h & 0xFF);
                }
                respond(block);
            }
            cmd_.erase(cmd_.begin(), cmd_.begin() + 5);
        } else {
            cmd_.erase(cmd_.begin());
        }
    }
    return true;
}

int SimulatedLogger::readSome(uint8_t* buf, size_t max, int /*timeout_ms*/) {
    if (!open_) { last_error_ = "serial not open"; return -1; }
    size_t n = std::min(max, pending_.size());
    std::copy(pending_.begin(), pending_.begin() + (long)n, buf);
    pending_.erase(pending_.begin(), pending_.begin() + (long)n);
    return (int)n;
}

std::unique_ptr<SerialLink> SimulatedLoggerOpener::open(const std::string& port, int baud, std::string& error) {
    if (port != kSimulatedPort) {
        error = "no simulated logger on " + port;
        return nullptr;
    }
    return std::make_unique<SimulatedLogger>(profile_, baud);
}
