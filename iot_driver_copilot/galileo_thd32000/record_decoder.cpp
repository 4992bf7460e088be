#include "record_decoder.h"

#include "galileo_protocol.h"

static uint16_t rd16_be(const uint8_t* p) {
    return (uint16_t)(((uint16_t)p[0] << 8) | p[1]);
}

static uint32_t rd32_be(const uint8_t* p) {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

static uint8_t temperature_status(uint16_t raw, double value) {
    if (raw == 0x7FFF || raw == 0x8000) return kStatusTempFault;
    if (value < kTempMinValid || value > kTempMaxValid) return kStatusTempFault;
    return kStatusOk;
}

static uint8_t humidity_status(uint16_t raw, double value) {
    if (raw == 0xFFFF || value > kHumidityMaxValid) return kStatusHumidityFault;
    return kStatusOk;
}

DecodeResult decode_chunk(const Chunk& chunk, const DeviceInfo& info) {
    DecodeResult res;
    const size_t width = record_width(info.format);
    const size_t len = chunk.payload.size();

    if (len % width != 0) {
        res.error = "payload of " + std::to_string(len) + " bytes is not a multiple of the " +
                    std::to_string(width) + "-byte record width";
        return res;
    }

    const size_t count = len / width;
    res.records.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        const uint8_t* p = chunk.payload.data() + i * width;
        const uint32_t index = chunk.first_index + (uint32_t)i;
        const int64_t computed_ts = info.start_timestamp + (int64_t)index * (int64_t)info.interval_seconds;

        MeasurementRecord rec;
        rec.index = index;
        rec.timestamp = computed_ts;

        if (info.format == RecordFormat::Stamped) {
            int64_t embedded = (int64_t)rd32_be(p);
            rec.timestamp = embedded;
            if (embedded != computed_ts) rec.status |= kStatusTimestampMismatch;
            p += 4;
        }

        const uint16_t t_raw = rd16_be(p);
        const uint16_t h_raw = rd16_be(p + 2);
        // Inside the declared count the marker words are a real reading
        if (index >= info.record_count && is_end_marker(t_raw, h_raw)) {
            res.ended = true;
            res.end_index = index;
            break;
        }

        rec.temperature = (int16_t)t_raw / 10.0;
        rec.humidity = h_raw / 10.0;
        rec.status |= temperature_status(t_raw, rec.temperature);
        rec.status |= humidity_status(h_raw, rec.humidity);
        res.records.push_back(rec);
    }

    res.ok = true;
    return res;
}
