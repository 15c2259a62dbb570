#ifndef RGB565_H
#define RGB565_H

#include "Image.h"
#include <cstddef>
#include <cstdint>
#include <vector>

using color_t = uint16_t;

// RGB888 -> RGB565, low bits of each channel dropped
constexpr color_t RGB(uint8_t r, uint8_t g, uint8_t b) {
    return static_cast<color_t>(((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3));
}

// Pack `pixel_count` pixels of `bytes_per_pixel` (3 = RGB, 4 = RGBA, alpha ignored)
// into little-endian RGB565 words.
std::vector<uint8_t> to_rgb565_le(const uint8_t* pixels, size_t pixel_count, int bytes_per_pixel);

inline std::vector<uint8_t> to_rgb565_le(const ImageRGBA& image) {
    return to_rgb565_le(image.data.data(), static_cast<size_t>(image.w) * image.h, 4);
}

#endif // RGB565_H
