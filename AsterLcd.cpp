#include "AsterLcd.h"
#include "LcdError.h"
#include "Rgb565.h"
#include "utils.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <thread>

AsterLcd::AsterLcd(std::unique_ptr<SerialPort> port, const AsterLcdOptions& options)
    : port_(std::move(port)),
      enable_cache_(options.enable_cache),
      no_init_check_(options.no_init_check),
      settle_ms_(options.settle_ms) {
    debug_ = getenv_bool("ASTER_DEBUG", false);
    tx_buf_.reserve(sizeof(LCD_CMD_CHUNK) + 4 + IMG_CHUNK_SIZE);
}

AsterLcd::~AsterLcd() = default;

std::unique_ptr<AsterLcd> AsterLcd::OpenDevice(const std::string& device, int timeout_ms,
                                               const AsterLcdOptions& options) {
    auto port = std::make_unique<PosixSerialPort>(device, timeout_ms);
    port->Open();
    return std::make_unique<AsterLcd>(std::move(port), options);
}

std::unique_ptr<AsterLcd> AsterLcd::OpenUsb(uint16_t vid, uint16_t pid, int timeout_ms,
                                            const AsterLcdOptions& options) {
    std::string device = FindUsbSerialPort(vid, pid);
    if (device.empty()) {
        char id[16];
        std::snprintf(id, sizeof(id), "%x:%x", vid, pid);
        throw LcdError(LcdError::Kind::NoDevice, std::string("USB serial port ") + id + " not found");
    }
    return OpenDevice(device, timeout_ms, options);
}

std::unique_ptr<AsterLcd> AsterLcd::OpenUsbId(const std::string& id, int timeout_ms,
                                              const AsterLcdOptions& options) {
    size_t sep = id.find(':');
    if (sep == std::string::npos || sep == 0 || sep + 1 >= id.size()) {
        throw LcdError(LcdError::Kind::NoDevice,
                       "Error parsing serial port ID '" + id + "'. Expected `vid:pid` format.");
    }
    unsigned long vid = 0;
    unsigned long pid = 0;
    try {
        vid = std::stoul(id.substr(0, sep), nullptr, 16);
        pid = std::stoul(id.substr(sep + 1), nullptr, 16);
    } catch (const std::exception& e) {
        throw LcdError(LcdError::Kind::NoDevice, "Invalid serial port ID '" + id + "': " + e.what());
    }
    if (vid > 0xFFFF || pid > 0xFFFF) {
        throw LcdError(LcdError::Kind::NoDevice, "Invalid serial port ID '" + id + "'");
    }
    return OpenUsb(static_cast<uint16_t>(vid), static_cast<uint16_t>(pid), timeout_ms, options);
}

std::unique_ptr<AsterLcd> AsterLcd::Simulate(const AsterLcdOptions& options) {
    return std::make_unique<AsterLcd>(std::make_unique<SimulatedSerialPort>(), options);
}

SerialPort& AsterLcd::port(const char* what) {
    if (!port_) {
        throw LcdError(LcdError::Kind::NotConnected, std::string("LCD port not open: ") + what);
    }
    return *port_;
}

void AsterLcd::Init() {
    SerialPort& p = port("init");
    send(LCD_CMD_DISPLAY_ON, sizeof(LCD_CMD_DISPLAY_ON), "display on");

    if (no_init_check_) {
        std::cerr << "[LCD] Test mode: only writing to the display" << std::endl;
    } else {
        std::this_thread::sleep_for(std::chrono::milliseconds(settle_ms_));

        int available = p.BytesAvailable();
        if (available < 0) {
            throw LcdError(LcdError::Kind::Io,
                           "Failed to get available bytes from serial port: " + p.LastError());
        }
        if (available == 0) {
            throw LcdError(LcdError::Kind::Handshake, "Initialization failed, no response received");
        }
        std::vector<uint8_t> response(static_cast<size_t>(available));
        int n = p.Read(response.data(), response.size());
        if (n < 0) {
            throw LcdError(LcdError::Kind::Io, "Failed to read from serial port: " + p.LastError());
        }
        response.resize(static_cast<size_t>(n));
        if (std::find(response.begin(), response.end(), 'A') == response.end()) {
            throw LcdError(LcdError::Kind::Handshake,
                           "Initialization failed, received: " +
                               std::string(response.begin(), response.end()));
        }
    }

    std::cout << "[LCD] Display initialized!" << std::endl;
}

void AsterLcd::PowerOn() {
    send(LCD_CMD_DISPLAY_ON, sizeof(LCD_CMD_DISPLAY_ON), "display on");
}

void AsterLcd::PowerOff() {
    send(LCD_CMD_DISPLAY_OFF, sizeof(LCD_CMD_DISPLAY_OFF), "display off");
}

SendStats AsterLcd::SendFrame(const ImageRGBA& image) {
    return SendRgb565(to_rgb565_le(image));
}

SendStats AsterLcd::SendRgb565(const std::vector<uint8_t>& rgb565) {
    port("send frame");
    bool use_cache = enable_cache_ && !prev_frame_.empty() && prev_frame_.size() >= rgb565.size();
    if (debug_) {
        std::cout << "[LCD] Start sending image (size " << rgb565.size() << ") "
                  << (use_cache ? "with" : "without") << " cache..." << std::endl;
    }
    auto start = std::chrono::steady_clock::now();
    SendStats stats;

    send(LCD_CMD_FRAME_START, sizeof(LCD_CMD_FRAME_START), "frame start");

    for (size_t offset = 0; offset < rgb565.size(); offset += IMG_CHUNK_SIZE) {
        size_t len = std::min(IMG_CHUNK_SIZE, rgb565.size() - offset);
        if (use_cache && std::memcmp(prev_frame_.data() + offset, rgb565.data() + offset, len) == 0) {
            ++stats.chunks_skipped;
            continue;
        }

        uint32_t off = static_cast<uint32_t>(offset);
        tx_buf_.assign(LCD_CMD_CHUNK, LCD_CMD_CHUNK + sizeof(LCD_CMD_CHUNK));
        tx_buf_.push_back(static_cast<uint8_t>(off & 0xFF));
        tx_buf_.push_back(static_cast<uint8_t>((off >> 8) & 0xFF));
        tx_buf_.push_back(static_cast<uint8_t>((off >> 16) & 0xFF));
        tx_buf_.push_back(static_cast<uint8_t>((off >> 24) & 0xFF));
        tx_buf_.insert(tx_buf_.end(), rgb565.begin() + offset, rgb565.begin() + offset + len);

        send(tx_buf_.data(), tx_buf_.size(), "image data chunk " + std::to_string(offset / IMG_CHUNK_SIZE));
        ++stats.chunks_sent;
        stats.bytes_sent += len;
    }

    send(LCD_CMD_FRAME_END, sizeof(LCD_CMD_FRAME_END), "frame end");

    if (enable_cache_) {
        prev_frame_ = rgb565;
    }

    if (debug_) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - start).count();
        std::cout << "[LCD] Image sent: " << ms << "ms, " << stats.chunks_sent << " chunks, "
                  << stats.chunks_skipped << " skipped" << std::endl;
    }
    return stats;
}

void AsterLcd::SetCacheEnabled(bool enable) {
    enable_cache_ = enable;
    if (!enable) {
        ClearCache();
    }
}

void AsterLcd::ClearCache() {
    prev_frame_.clear();
    prev_frame_.shrink_to_fit();
}

void AsterLcd::Close() {
    if (!port_) return;
    try {
        PowerOff();
    } catch (const LcdError& e) {
        std::cerr << "[LCD] Failed to switch off display: " << e.what() << std::endl;
    }
    port_.reset();
}

void AsterLcd::send(const uint8_t* data, size_t len, const std::string& what) {
    SerialPort& p = port(what.c_str());
    std::string last_error;
    for (int attempt = 1; attempt <= SERIAL_WRITE_ATTEMPTS; ++attempt) {
        if (p.WriteAll(data, len) && p.Flush()) {
            return;
        }
        last_error = p.LastError();
        if (attempt < SERIAL_WRITE_ATTEMPTS) {
            std::cerr << "[LCD] Failed to write " << what << " to display, retrying! Error: "
                      << last_error << std::endl;
        }
    }
    std::cerr << "[LCD] Failed to write " << what << " to display: " << last_error << std::endl;
    throw LcdError(LcdError::Kind::Io, "Failed to send " + what + ": " + last_error);
}
