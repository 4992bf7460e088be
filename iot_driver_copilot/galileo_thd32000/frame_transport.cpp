#include "frame_transport.h"

#include <algorithm>
#include <chrono>

#include "logger.h"

using namespace std::chrono;

// Upper bound on bytes buffered while hunting for a header magic.
static const size_t kMaxHuntBytes = kHeaderFrameLen * 4;

const char* read_status_name(ReadStatus s) {
    switch (s) {
        case ReadStatus::Frame: return "frame";
        case ReadStatus::Timeout: return "timeout";
        case ReadStatus::Garbage: return "garbage";
        case ReadStatus::LinkError: return "link error";
    }
    return "unknown";
}

static size_t expected_length(Command command) {
    switch (command) {
        case Command::Probe: return kAckFrameLen;
        case Command::ReadHeader: return kHeaderFrameLen;
        case Command::ReadBlock: return kBlockFrameLen;
    }
    return 0;
}

FrameTransport::FrameTransport(SerialLink* link) : link_(link) {}

size_t FrameTransport::findMagic(size_t from) const {
    for (size_t i = from; i + 1 < rx_.size(); ++i) {
        if (rx_[i] == kHeaderMagic0 && rx_[i + 1] == kHeaderMagic1) return i;
    }
    return rx_.size();
}

bool FrameTransport::frameComplete(Command command) const {
    if (command == Command::ReadHeader) {
        size_t pos = findMagic(0);
        if (pos < rx_.size()) return rx_.size() - pos >= kHeaderFrameLen;
        return rx_.size() >= kMaxHuntBytes;
    }
    return rx_.size() >= expected_length(command);
}

void FrameTransport::discardToNextStart(Command command) {
    if (command == Command::ReadHeader) {
        size_t next = findMagic(1);
        if (next < rx_.size()) {
            rx_.erase(rx_.begin(), rx_.begin() + (long)next);
            return;
        }
    }
    rx_.clear();
}

ReadResult FrameTransport::finish(Command command) {
    ReadResult res;
    res.bytes_received = rx_.size();
    res.frame.command = command;

    if (rx_.empty()) {
        res.status = ReadStatus::Timeout;
        res.detail = std::string("no response to ") + command_name(command);
        return res;
    }

    if (command == Command::ReadHeader) {
        size_t pos = findMagic(0);
        if (pos < rx_.size() && rx_.size() - pos >= kHeaderLen) {
            size_t len = std::min(kHeaderFrameLen, rx_.size() - pos);
            res.frame.payload.assign(rx_.begin() + (long)pos, rx_.begin() + (long)(pos + len));
            res.frame.valid = true;
            res.status = ReadStatus::Frame;
            if (pos > 0) log_debug("header resync: skipped " + std::to_string(pos) + " noise bytes");
            rx_.erase(rx_.begin(), rx_.begin() + (long)(pos + len));
            return res;
        }
        res.status = ReadStatus::Garbage;
        res.detail = pos < rx_.size() ? "truncated header" : "header magic not found";
        discardToNextStart(command);
        return res;
    }

    const size_t need = expected_length(command);
    if (rx_.size() < need) {
        res.status = ReadStatus::Garbage;
        res.detail = std::string("short ") + command_name(command) + " frame: " +
                     std::to_string(rx_.size()) + "/" + std::to_string(need) + " bytes";
        discardToNextStart(command);
        return res;
    }

    if (command == Command::Probe) {
        bool idle_line = std::all_of(rx_.begin(), rx_.begin() + (long)need, [](uint8_t b) { return b == 0x00; }) ||
                         std::all_of(rx_.begin(), rx_.begin() + (long)need, [](uint8_t b) { return b == 0xFF; });
        if (idle_line) {
            res.status = ReadStatus::Garbage;
            res.detail = "acknowledgment is line noise";
            discardToNextStart(command);
            return res;
        }
    }

    res.frame.payload.assign(rx_.begin(), rx_.begin() + (long)need);
    res.frame.valid = true;
    res.status = ReadStatus::Frame;
    rx_.erase(rx_.begin(), rx_.begin() + (long)need);
    return res;
}

ReadResult FrameTransport::readFrame(Command command, int timeout_ms) {
    const auto deadline = steady_clock::now() + milliseconds(timeout_ms);
    uint8_t tmp[256];

    while (!frameComplete(command)) {
        int remain_ms = (int)duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        if (remain_ms <= 0) break;

        int n = link_->readSome(tmp, sizeof(tmp), remain_ms);
        if (n < 0) {
            ReadResult res;
            res.status = ReadStatus::LinkError;
            res.frame.command = command;
            res.bytes_received = rx_.size();
            res.detail = link_->lastError();
            rx_.clear();
            return res;
        }
        if (n == 0) break;
        rx_.insert(rx_.end(), tmp, tmp + n);
    }
    return finish(command);
}

ReadResult FrameTransport::exchange(const Request& req, int timeout_ms) {
    rx_.clear();
    link_->flushInput();

    if (!link_->writeAll(req.bytes.data(), req.bytes.size())) {
        ReadResult res;
        res.status = ReadStatus::LinkError;
        res.frame.command = req.command;
        res.detail = "write failed: " + link_->lastError();
        return res;
    }
    return readFrame(req.command, timeout_ms);
}

ReadResult FrameTransport::call(const Request& req, int timeout_ms) {
    ReadResult res = exchange(req, timeout_ms);
    if (res.status == ReadStatus::Timeout || res.status == ReadStatus::Garbage) {
        log_warn(std::string(command_name(req.command)) + ": " + read_status_name(res.status) +
                 " (" + res.detail + "), retrying once");
        res = exchange(req, timeout_ms);
        res.attempts = 2;
    }
    return res;
}
