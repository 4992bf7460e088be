#ifndef SERIAL_LINK_H
#define SERIAL_LINK_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Byte-level half-duplex link to the logger. Implemented by SerialPort for real
// hardware and by SimulatedLogger for SIMULATION mode.
class SerialLink {
public:
    virtual ~SerialLink() {}

    virtual bool isOpen() const = 0;
    virtual void closePort() = 0;

    virtual bool writeAll(const uint8_t* data, size_t len) = 0;

    // Waits at most timeout_ms for input, then reads whatever is available
    // (up to max bytes). Returns the byte count, 0 on timeout, -1 on error.
    virtual int readSome(uint8_t* buf, size_t max, int timeout_ms) = 0;

    // Drops any bytes received but not yet read.
    virtual void flushInput() = 0;

    virtual std::string lastError() const = 0;
};

// Opens a link on (port, baud). Returns nullptr and fills error when the OS
// refuses the port.
class LinkOpener {
public:
    virtual ~LinkOpener() {}
    virtual std::unique_ptr<SerialLink> open(const std::string& port, int baud, std::string& error) = 0;
};

#endif // SERIAL_LINK_H
