#include "serial_port.h"

#include <termios.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/select.h>
#include <sys/ioctl.h>
#include <cerrno>
#include <cstring>
#include <utility>

static bool baud_to_flag(int baud, speed_t& out) {
    switch (baud) {
        case 1200: out = B1200; return true;
        case 2400: out = B2400; return true;
        case 4800: out = B4800; return true;
        case 9600: out = B9600; return true;
        case 19200: out = B19200; return true;
        case 38400: out = B38400; return true;
        case 57600: out = B57600; return true;
        case 115200: out = B115200; return true;
        default: return false;
    }
}

bool is_supported_baud(int baud) {
    speed_t unused;
    return baud_to_flag(baud, unused);
}

SerialPort::SerialPort() : fd_(-1), last_error_("") {}
SerialPort::~SerialPort() { closePort(); }

bool SerialPort::openPort(const std::string& device, int baudrate) {
    closePort();

    speed_t speed;
    if (!baud_to_flag(baudrate, speed)) {
        last_error_ = "unsupported baud rate: " + std::to_string(baudrate);
        return false;
    }

    fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        last_error_ = std::string("open failed: ") + std::strerror(errno);
        return false;
    }

    termios tty{};
    if (tcgetattr(fd_, &tty) != 0) {
        last_error_ = std::string("tcgetattr failed: ") + std::strerror(errno);
        closePort();
        return false;
    }

    cfmakeraw(&tty);
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    // 8N1, no flow control
    tty.c_cflag &= ~(CSIZE | PARENB | CSTOPB | CRTSCTS);
    tty.c_cflag |= CS8 | CLOCAL | CREAD;

    tty.c_iflag = IGNPAR;
    tty.c_oflag = 0;
    tty.c_lflag = 0;

    // Timeouts are handled with select
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
        last_error_ = std::string("tcsetattr failed: ") + std::strerror(errno);
        closePort();
        return false;
    }

    int lines = TIOCM_DTR | TIOCM_RTS;
    if (ioctl(fd_, TIOCMBIS, &lines) != 0) {
        last_error_ = std::string("TIOCMBIS failed: ") + std::strerror(errno);
        closePort();
        return false;
    }

    tcflush(fd_, TCIOFLUSH);
    last_error_.clear();
    return true;
}

void SerialPort::closePort() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SerialPort::isOpen() const { return fd_ >= 0; }

bool SerialPort::writeAll(const uint8_t* data, size_t len) {
    if (fd_ < 0) { last_error_ = "serial not open"; return false; }
    size_t written = 0;
    while (written < len) {
        ssize_t w = ::write(fd_, data + written, len - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                fd_set wfds;
                FD_ZERO(&wfds);
                FD_SET(fd_, &wfds);
                timeval tv{1, 0};
                if (select(fd_ + 1, nullptr, &wfds, nullptr, &tv) <= 0) {
                    last_error_ = "write stalled";
                    return false;
                }
                continue;
            }
            last_error_ = std::string("write failed: ") + std::strerror(errno);
            return false;
        }
        written += (size_t)w;
    }
    tcdrain(fd_);
    return true;
}

int SerialPort::readSome(uint8_t* buf, size_t max, int timeout_ms) {
    if (fd_ < 0) { last_error_ = "serial not open"; return -1; }
    if (max == 0) return 0;

    while (true) {
        fd_set rfds;
        FD_ZERO(&rfds);
        FD_SET(fd_, &rfds);
        timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;

        int rv = select(fd_ + 1, &rfds, nullptr, nullptr, &tv);
        if (rv < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("select failed: ") + std::strerror(errno);
            return -1;
        } else if (rv == 0) {
            return 0;
        }

        ssize_t r = ::read(fd_, buf, max);
        if (r < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            last_error_ = std::string("read failed: ") + std::strerror(errno);
            return -1;
        }
        if (r == 0) {
            // USB-CDC devices report readable + 0 bytes when unplugged
            last_error_ = "device disconnected";
            return -1;
        }
        return (int)r;
    }
}

void SerialPort::flushInput() {
    if (fd_ >= 0) tcflush(fd_, TCIFLUSH);
}

std::unique_ptr<SerialLink> SerialPortOpener::open(const std::string& port, int baud, std::string& error) {
    auto sp = std::make_unique<SerialPort>();
    if (!sp->openPort(port, baud)) {
        error = sp->lastError();
        return nullptr;
    }
    return std::move(sp);
}
