#include "SerialPort.h"
#include "LcdError.h"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace fs = std::filesystem;

PosixSerialPort::PosixSerialPort(const std::string& device, int timeout_ms)
    : device_(device), timeout_ms_(timeout_ms) {}

PosixSerialPort::~PosixSerialPort() {
    if (fd_ != -1) {
        close(fd_);
    }
}

void PosixSerialPort::Open() {
    fd_ = open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        throw LcdError(LcdError::Kind::NoDevice,
                       "Error opening serial port " + device_ + ": " + std::strerror(errno));
    }

    struct termios tty = {};
    if (tcgetattr(fd_, &tty) != 0) {
        std::string err = std::strerror(errno);
        close(fd_);
        fd_ = -1;
        throw LcdError(LcdError::Kind::Io, "tcgetattr failed on " + device_ + ": " + err);
    }
    cfmakeraw(&tty);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~(CSTOPB | CRTSCTS);
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = static_cast<cc_t>(std::clamp(timeout_ms_ / 100, 0, 255));
    cfsetispeed(&tty, B1500000);
    cfsetospeed(&tty, B1500000);
    if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
        std::string err = std::strerror(errno);
        close(fd_);
        fd_ = -1;
        throw LcdError(LcdError::Kind::Io, "tcsetattr failed on " + device_ + ": " + err);
    }
    tcflush(fd_, TCIOFLUSH);

    std::cout << "[LCD] Opened serial port " << device_
              << ": baud=" << UART_BAUDRATE << ", 8N1"
              << " timeout=" << timeout_ms_ << "ms" << std::endl;
}

bool PosixSerialPort::waitWritable() {
    struct pollfd pfd = {fd_, POLLOUT, 0};
    int r = poll(&pfd, 1, timeout_ms_);
    if (r == 0) {
        last_error_ = "write timed out";
        return false;
    }
    if (r < 0) {
        last_error_ = std::strerror(errno);
        return false;
    }
    return true;
}

bool PosixSerialPort::WriteAll(const uint8_t* data, size_t len) {
    if (fd_ < 0) {
        last_error_ = "port not open";
        return false;
    }
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = write(fd_, data + sent, len - sent);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            last_error_ = std::strerror(errno);
            return false;
        }
        if (!waitWritable()) return false;
    }
    return true;
}

bool PosixSerialPort::Flush() {
    if (fd_ < 0) return false;
    if (tcdrain(fd_) != 0) {
        last_error_ = std::strerror(errno);
        return false;
    }
    return true;
}

int PosixSerialPort::BytesAvailable() {
    if (fd_ < 0) return -1;
    int available = 0;
    if (ioctl(fd_, FIONREAD, &available) == -1) {
        last_error_ = std::strerror(errno);
        return -1;
    }
    return available;
}

int PosixSerialPort::Read(uint8_t* buf, size_t len) {
    if (fd_ < 0) return -1;
    ssize_t n = read(fd_, buf, len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
        last_error_ = std::strerror(errno);
        return -1;
    }
    return static_cast<int>(n);
}

bool SimulatedSerialPort::WriteAll(const uint8_t* /*data*/, size_t len) {
    // 10 bits per byte on the wire (start + 8 data + stop)
    auto us = static_cast<long long>(len) * 10 * 1000000 / UART_BAUDRATE;
    std::this_thread::sleep_for(std::chrono::microseconds(us));
    return true;
}

int SimulatedSerialPort::Read(uint8_t* buf, size_t len) {
    if (len == 0) return 0;
    buf[0] = 'A';
    return 1;
}

static std::string read_sysfs_line(const fs::path& path) {
    std::ifstream f(path);
    std::string line;
    if (f.is_open()) std::getline(f, line);
    return line;
}

std::string FindUsbSerialPort(uint16_t vid, uint16_t pid) {
    std::cout << "[LCD] Looking for USB serial port " << std::hex << vid << ":" << pid
              << std::dec << std::endl;
    const fs::path tty_root("/sys/class/tty");
    std::error_code ec;
    if (!fs::exists(tty_root, ec)) return "";

    for (const auto& entry : fs::directory_iterator(tty_root, ec)) {
        fs::path device_link = entry.path() / "device";
        if (!fs::exists(device_link, ec)) continue;
        fs::path dir = fs::canonical(device_link, ec);
        if (ec) continue;

        // idVendor/idProduct live on the USB device node, a few levels above the interface
        for (int depth = 0; depth < 4 && !dir.empty() && dir != dir.root_path(); ++depth) {
            if (fs::exists(dir / "idVendor", ec) && fs::exists(dir / "idProduct", ec)) {
                unsigned long v = std::strtoul(read_sysfs_line(dir / "idVendor").c_str(), nullptr, 16);
                unsigned long p = std::strtoul(read_sysfs_line(dir / "idProduct").c_str(), nullptr, 16);
                if (v == vid && p == pid) {
                    return "/dev/" + entry.path().filename().string();
                }
                break;
            }
            dir = dir.parent_path();
        }
    }
    return "";
}
