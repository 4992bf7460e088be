#ifndef SERIAL_PORT_H
#define SERIAL_PORT_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "serial_link.h"

bool is_supported_baud(int baud);

class SerialPort : public SerialLink {
public:
    SerialPort();
    ~SerialPort() override;

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    // Raw 8N1, no flow control. DTR and RTS are asserted after configuration;
    // the THD 32000 USB bridge stays silent otherwise.
    bool openPort(const std::string& device, int baudrate);

    void closePort() override;
    bool isOpen() const override;
    bool writeAll(const uint8_t* data, size_t len) override;
    int readSome(uint8_t* buf, size_t max, int timeout_ms) override;
    void flushInput() override;
    std::string lastError() const override { return last_error_; }

private:
    int fd_;
    std::string last_error_;
};

class SerialPortOpener : public LinkOpener {
public:
    std::unique_ptr<SerialLink> open(const std::string& port, int baud, std::string& error) override;
};

#endif // SERIAL_PORT_H
