#ifndef GALILEO_PROTOCOL_H
#define GALILEO_PROTOCOL_H

/*
 * Galileo THD 32000 serial command set.
 *
 *   probe         host: 5C               device: 16-byte acknowledgment
 *   read header   host: AD DA            device: 64 bytes, header at magic D1 1C
 *   read block n  host: D3 DA n 00 00    device: 128 bytes = 32 records
 *
 * Header (offsets from the magic):
 *   0-1   D1 1C
 *   2-13  model / firmware identifier
 *   14-19 start of recording, BCD: YY MM DD hh mm ss (year 20YY)
 *   20    sampling interval, minutes
 *   21-22 stored record count, big endian
 *
 * Record (plain): temperature int16 BE, humidity uint16 BE, both in tenths.
 * A record whose two words are each 0000 or FFFF marks the end of data.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "measurement.h"

enum class Command : uint8_t {
    Probe = 0x5C,
    ReadHeader = 0xAD,
    ReadBlock = 0xD3
};

const char* command_name(Command cmd);

constexpr uint8_t kHeaderMagic0 = 0xD1;
constexpr uint8_t kHeaderMagic1 = 0x1C;

constexpr size_t kAckFrameLen = 16;
constexpr size_t kHeaderFrameLen = 64;
constexpr size_t kHeaderLen = 28;
constexpr size_t kBlockFrameLen = 128;
constexpr size_t kRecordsPerBlock = kBlockFrameLen / 4;
constexpr size_t kMaxBlocks = 255;
constexpr size_t kMaxRecords = kRecordsPerBlock * kMaxBlocks;

struct Request {
    Command command;
    std::vector<uint8_t> bytes;
};

Request build_probe_request();
Request build_header_request();
Request build_block_request(uint8_t block);

// Returns -1 when either nibble is not a decimal digit.
int bcd_to_int(uint8_t b);
uint8_t int_to_bcd(int v);

// Parses a header that starts at the magic. Needs kHeaderLen bytes.
bool parse_header(const uint8_t* data, size_t len, DeviceInfo& out, std::string& error);

// Inverse of parse_header, used by the simulated logger.
std::vector<uint8_t> encode_header(const DeviceInfo& info);

// True when both raw words are empty-memory patterns.
inline bool is_end_marker(uint16_t t_raw, uint16_t h_raw) {
    return (t_raw == 0x0000 || t_raw == 0xFFFF) && (h_raw == 0x0000 || h_raw == 0xFFFF);
}

#endif // GALILEO_PROTOCOL_H
