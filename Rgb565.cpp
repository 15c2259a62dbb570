#include "Rgb565.h"

std::vector<uint8_t> to_rgb565_le(const uint8_t* pixels, size_t pixel_count, int bytes_per_pixel) {
    std::vector<uint8_t> out(pixel_count * 2);
    for (size_t i = 0; i < pixel_count; ++i) {
        const uint8_t* p = pixels + i * bytes_per_pixel;
        color_t c = RGB(p[0], p[1], p[2]);
        out[i * 2 + 0] = static_cast<uint8_t>(c & 0xFF);
        out[i * 2 + 1] = static_cast<uint8_t>(c >> 8);
    }
    return out;
}
