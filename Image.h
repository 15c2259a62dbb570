#ifndef IMAGE_H
#define IMAGE_H

#include <cstddef>
#include <cstdint>
#include <vector>

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

// Straight (non-premultiplied) RGBA bitmap, row-major, 4 bytes per pixel.
struct ImageRGBA {
    int w = 0;
    int h = 0;
    std::vector<uint8_t> data;

    ImageRGBA() = default;
    ImageRGBA(int width, int height)
        : w(width), h(height), data(static_cast<size_t>(width) * height * 4, 0) {}

    bool empty() const { return w <= 0 || h <= 0; }
    bool contains(int x, int y) const { return x >= 0 && y >= 0 && x < w && y < h; }
    uint8_t* pixel(int x, int y) { return &data[(static_cast<size_t>(y) * w + x) * 4]; }
    const uint8_t* pixel(int x, int y) const { return &data[(static_cast<size_t>(y) * w + x) * 4]; }
};

// out = src * a + dst * (1 - a) for all four channels, a = src alpha.
void blend_over(uint8_t* dst, const uint8_t* src);

// Alpha-blend `src` onto `target` with its top-left corner at (x, y). Clipped.
void paste_image(ImageRGBA& target, const ImageRGBA& src, int x, int y);

// Bounding box of all pixels with non-zero alpha. Returns false for a fully transparent image.
bool opaque_bounds(const ImageRGBA& image, Rect& out);

// Rotate clockwise by `angle_degrees`. Multiples of 90 are exact pixel transpositions;
// other angles rotate about the center with bilinear sampling and keep the dimensions.
ImageRGBA rotate_image(const ImageRGBA& image, int angle_degrees);
ImageRGBA rotate_90(const ImageRGBA& image, bool clockwise);
ImageRGBA rotate_180(const ImageRGBA& image);
ImageRGBA rotate_about_center(const ImageRGBA& image, float angle_radians);

// Stretch to exactly w x h, ignoring the aspect ratio (bilinear).
ImageRGBA resize_exact(const ImageRGBA& image, int w, int h);

#endif // IMAGE_H
