#ifndef ASTER_LCD_H
#define ASTER_LCD_H

#include "Image.h"
#include "SerialPort.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Display Configuration (AOOSTAR WTR MAX / GEM12+ PRO panel)
const int DISPLAY_WIDTH = 960;
const int DISPLAY_HEIGHT = 376;

const uint16_t USB_UART_VID = 0x0416;
const uint16_t USB_UART_PID = 0x90A1;

const size_t IMG_CHUNK_SIZE = 47;
const int SERIAL_WRITE_ATTEMPTS = 3;

// Protocol commands. Every command starts with the AA 55 AA 55 magic.
const uint8_t LCD_CMD_DISPLAY_OFF[8] = {0xAA, 0x55, 0xAA, 0x55, 0x0A, 0x00, 0x00, 0x00};
const uint8_t LCD_CMD_DISPLAY_ON[8]  = {0xAA, 0x55, 0xAA, 0x55, 0x0B, 0x00, 0x00, 0x00};
const uint8_t LCD_CMD_FRAME_START[16] = {0xAA, 0x55, 0xAA, 0x55, 0x05, 0x00, 0x00, 0x00,
                                         0x04, 0x00, 0x0F, 0x2F, 0x00, 0x04, 0x0B, 0x00};
const uint8_t LCD_CMD_FRAME_END[8]   = {0xAA, 0x55, 0xAA, 0x55, 0x06, 0x00, 0x00, 0x00};
const uint8_t LCD_CMD_CHUNK[8]       = {0xAA, 0x55, 0xAA, 0x55, 0x08, 0x00, 0x00, 0x00};

struct AsterLcdOptions {
    bool enable_cache = true;
    // Test mode: skip the response check after switching the display on.
    bool no_init_check = false;
    int settle_ms = 1000;
};

struct SendStats {
    size_t chunks_sent = 0;
    size_t chunks_skipped = 0;
    size_t bytes_sent = 0;
};

// Driver for the USB-serial LCD controller. Frames are sent as RGB565 in 47 byte
// chunks; chunks identical to the previously sent frame are skipped.
// All operations throw LcdError.
class AsterLcd {
public:
    AsterLcd(std::unique_ptr<SerialPort> port, const AsterLcdOptions& options = AsterLcdOptions());
    ~AsterLcd();

    static std::unique_ptr<AsterLcd> OpenDevice(const std::string& device, int timeout_ms,
                                                const AsterLcdOptions& options = AsterLcdOptions());
    static std::unique_ptr<AsterLcd> OpenUsb(uint16_t vid, uint16_t pid, int timeout_ms,
                                             const AsterLcdOptions& options = AsterLcdOptions());
    // "vid:pid" in hex, e.g. "416:90A1"
    static std::unique_ptr<AsterLcd> OpenUsbId(const std::string& id, int timeout_ms,
                                               const AsterLcdOptions& options = AsterLcdOptions());
    static std::unique_ptr<AsterLcd> Simulate(const AsterLcdOptions& options = AsterLcdOptions());

    // Switch the display on and verify that the controller answers.
    void Init();
    void PowerOn();
    void PowerOff();
    SendStats SendFrame(const ImageRGBA& image);
    SendStats SendRgb565(const std::vector<uint8_t>& rgb565);

    void SetCacheEnabled(bool enable);
    bool IsCacheEnabled() const { return enable_cache_; }
    void ClearCache();

    // Switch the display off (best effort) and release the port.
    void Close();
    bool IsOpen() const { return port_ != nullptr; }

private:
    SerialPort& port(const char* what);
    void send(const uint8_t* data, size_t len, const std::string& what);

    std::unique_ptr<SerialPort> port_;
    bool enable_cache_;
    bool no_init_check_;
    int settle_ms_;
    std::vector<uint8_t> prev_frame_;
    std::vector<uint8_t> tx_buf_;
    bool debug_ = false;
};

#endif // ASTER_LCD_H
