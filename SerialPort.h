#ifndef SERIAL_PORT_H
#define SERIAL_PORT_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

const uint32_t UART_BAUDRATE = 1500000;

// Byte-stream link to the display controller.
class SerialPort {
public:
    virtual ~SerialPort() = default;

    virtual std::string Name() const = 0;
    // Write every byte or fail. On failure LastError() describes the cause.
    virtual bool WriteAll(const uint8_t* data, size_t len) = 0;
    virtual bool Flush() = 0;
    // Bytes waiting in the receive buffer, -1 on error.
    virtual int BytesAvailable() = 0;
    // Returns bytes read, -1 on error.
    virtual int Read(uint8_t* buf, size_t len) = 0;
    virtual std::string LastError() const = 0;
};

// termios based tty, raw 8N1.
class PosixSerialPort : public SerialPort {
public:
    PosixSerialPort(const std::string& device, int timeout_ms);
    ~PosixSerialPort() override;

    // Throws LcdError if the device cannot be opened or configured.
    void Open();

    std::string Name() const override { return device_; }
    bool WriteAll(const uint8_t* data, size_t len) override;
    bool Flush() override;
    int BytesAvailable() override;
    int Read(uint8_t* buf, size_t len) override;
    std::string LastError() const override { return last_error_; }

private:
    bool waitWritable();

    std::string device_;
    int timeout_ms_;
    int fd_ = -1;
    std::string last_error_;
};

// Stand-in for the real device: consumes writes at roughly the wire speed and
// always answers the init handshake.
class SimulatedSerialPort : public SerialPort {
public:
    SimulatedSerialPort() = default;

    std::string Name() const override { return "simulated"; }
    bool WriteAll(const uint8_t* data, size_t len) override;
    bool Flush() override { return true; }
    int BytesAvailable() override { return 1; }
    int Read(uint8_t* buf, size_t len) override;
    std::string LastError() const override { return ""; }
};

// Look up the tty device of a USB serial adapter via sysfs, e.g. "/dev/ttyACM0".
// Returns an empty string if no matching device is attached.
std::string FindUsbSerialPort(uint16_t vid, uint16_t pid);

#endif // SERIAL_PORT_H
