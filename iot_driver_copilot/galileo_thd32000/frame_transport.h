#ifndef FRAME_TRANSPORT_H
#define FRAME_TRANSPORT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "galileo_protocol.h"
#include "serial_link.h"

struct Frame {
    Command command = Command::Probe;
    std::vector<uint8_t> payload;
    bool valid = false;
};

enum class ReadStatus {
    Frame,
    Timeout,     // nothing received before the deadline
    Garbage,     // bytes received but no valid frame
    LinkError    // the link itself failed (unplugged, write error)
};

const char* read_status_name(ReadStatus s);

struct ReadResult {
    ReadStatus status = ReadStatus::Timeout;
    Frame frame;
    size_t bytes_received = 0;
    int attempts = 1;
    std::string detail;

    bool ok() const { return status == ReadStatus::Frame; }
};

// Length-based framer for the THD 32000 command set. Strictly one request in
// flight: every send is followed by a terminal ReadResult before the next.
class FrameTransport {
public:
    explicit FrameTransport(SerialLink* link);

    // Accumulates bytes until the frame expected for `command` is complete or
    // the timeout elapses with no further bytes.
    ReadResult readFrame(Command command, int timeout_ms);

    // One flush + send + readFrame, no retry.
    ReadResult exchange(const Request& req, int timeout_ms);

    // exchange() retried once on Timeout or Garbage.
    ReadResult call(const Request& req, int timeout_ms);

    // Bytes received but not consumed by a frame yet.
    size_t buffered() const { return rx_.size(); }

private:
    bool frameComplete(Command command) const;
    ReadResult finish(Command command);
    void discardToNextStart(Command command);
    size_t findMagic(size_t from) const;

    SerialLink* link_;
    std::vector<uint8_t> rx_;
};

#endif // FRAME_TRANSPORT_H
