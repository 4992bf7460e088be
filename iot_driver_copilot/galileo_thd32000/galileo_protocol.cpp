#include "galileo_protocol.h"

#include <cstdio>
#include <ctime>

const char* command_name(Command cmd) {
    switch (cmd) {
        case Command::Probe: return "probe";
        case Command::ReadHeader: return "read-header";
        case Command::ReadBlock: return "read-block";
    }
    return "unknown";
}

Request build_probe_request() {
    return Request{Command::Probe, {0x5C}};
}

Request build_header_request() {
    return Request{Command::ReadHeader, {0xAD, 0xDA}};
}

Request build_block_request(uint8_t block) {
    return Request{Command::ReadBlock, {0xD3, 0xDA, block, 0x00, 0x00}};
}

int bcd_to_int(uint8_t b) {
    int hi = b >> 4;
    int lo = b & 0x0F;
    if (hi > 9 || lo > 9) return -1;
    return hi * 10 + lo;
}

uint8_t int_to_bcd(int v) {
    return (uint8_t)(((v / 10) % 10) << 4 | (v % 10));
}

static std::string decode_model(const uint8_t* p, size_t n) {
    bool printable = true;
    for (size_t i = 0; i < n; ++i) {
        if (p[i] != 0 && (p[i] < 0x20 || p[i] > 0x7E)) { printable = false; break; }
    }
    std::string out;
    if (printable) {
        for (size_t i = 0; i < n && p[i] != 0; ++i) out += (char)p[i];
        while (!out.empty() && out.back() == ' ') out.pop_back();
        while (!out.empty() && out.front() == ' ') out.erase(out.begin());
        return out;
    }
    char hex[4];
    for (size_t i = 0; i < n; ++i) {
        std::snprintf(hex, sizeof(hex), "%02X", p[i]);
        out += hex;
    }
    return out;
}

bool parse_header(const uint8_t* data, size_t len, DeviceInfo& out, std::string& error) {
    if (len < kHeaderLen) {
        error = "header too short: " + std::to_string(len) + " bytes";
        return false;
    }
    if (data[0] != kHeaderMagic0 || data[1] != kHeaderMagic1) {
        error = "header magic D1 1C not found";
        return false;
    }

    int year = bcd_to_int(data[14]);
    int month = bcd_to_int(data[15]);
    int day = bcd_to_int(data[16]);
    int hour = bcd_to_int(data[17]);
    int minute = bcd_to_int(data[18]);
    int second = bcd_to_int(data[19]);
    if (year < 0 || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        error = "invalid BCD start date in header";
        return false;
    }

    uint8_t interval_min = data[20];
    if (interval_min == 0) {
        error = "sampling interval of 0 minutes";
        return false;
    }

    std::tm tm{};
    tm.tm_year = 2000 + year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    DeviceInfo info;
    info.start_timestamp = (int64_t)timegm(&tm);
    info.interval_seconds = (uint32_t)interval_min * 60u;
    info.record_count = ((uint32_t)data[21] << 8) | data[22];
    info.model = decode_model(data + 2, 12);
    info.format = RecordFormat::Plain;

    if (info.record_count > kMaxRecords) {
        error = "record count " + std::to_string(info.record_count) + " exceeds device capacity";
        return false;
    }

    out = info;
    return true;
}

std::vector<uint8_t> encode_header(const DeviceInfo& info) {
    std::vector<uint8_t> h(kHeaderFrameLen, 0x00);
    h[0] = kHeaderMagic0;
    h[1] = kHeaderMagic1;
    for (size_t i = 0; i < 12; ++i) {
        h[2 + i] = i < info.model.size() ? (uint8_t)info.model[i] : (uint8_t)' ';
    }

    std::time_t t = static_cast<std::time_t>(info.start_timestamp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    h[14] = int_to_bcd((tm.tm_year + 1900) - 2000);
    h[15] = int_to_bcd(tm.tm_mon + 1);
    h[16] = int_to_bcd(tm.tm_mday);
    h[17] = int_to_bcd(tm.tm_hour);
    h[18] = int_to_bcd(tm.tm_min);
    h[19] = int_to_bcd(tm.tm_sec);
    h[20] = (uint8_t)(info.interval_seconds / 60u);
    h[21] = (uint8_t)((info.record_count >> 8) & 0xFF);
    h[22] = (uint8_t)(info.record_count & 0xFF);
    return h;
}
