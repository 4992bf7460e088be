#ifndef RECORD_DECODER_H
#define RECORD_DECODER_H

#include <cstdint>
#include <string>
#include <vector>

#include "measurement.h"

// Sensor range of the THD 32000 probe. Readings outside are kept but flagged.
constexpr double kTempMinValid = -40.0;
constexpr double kTempMaxValid = 85.0;
constexpr double kHumidityMaxValid = 100.0;

struct Chunk {
    uint32_t first_index = 0;   // series index of the first record in payload
    std::vector<uint8_t> payload;
};

struct DecodeResult {
    bool ok = false;
    std::string error;
    std::vector<MeasurementRecord> records;
    bool ended = false;       // an end-of-data marker past info.record_count was hit
    uint32_t end_index = 0;   // series index of that marker
};

// Pure: no I/O, no state.
DecodeResult decode_chunk(const Chunk& chunk, const DeviceInfo& info);

#endif // RECORD_DECODER_H
