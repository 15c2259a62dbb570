#include "Image.h"
#include <algorithm>
#include <cmath>

void blend_over(uint8_t* dst, const uint8_t* src) {
    float alpha = src[3] / 255.0f;
    float inv_alpha = 1.0f - alpha;
    for (int i = 0; i < 4; ++i) {
        float v = src[i] * alpha + dst[i] * inv_alpha;
        dst[i] = static_cast<uint8_t>(std::clamp(static_cast<int>(v + 0.5f), 0, 255));
    }
}

void paste_image(ImageRGBA& target, const ImageRGBA& src, int x, int y) {
    int x0 = std::max(0, x);
    int y0 = std::max(0, y);
    int x1 = std::min(target.w, x + src.w);
    int y1 = std::min(target.h, y + src.h);
    for (int ty = y0; ty < y1; ++ty) {
        for (int tx = x0; tx < x1; ++tx) {
            const uint8_t* s = src.pixel(tx - x, ty - y);
            if (s[3] == 0) continue;
            blend_over(target.pixel(tx, ty), s);
        }
    }
}

bool opaque_bounds(const ImageRGBA& image, Rect& out) {
    int min_x = image.w, min_y = image.h;
    int max_x = -1, max_y = -1;
    for (int y = 0; y < image.h; ++y) {
        const uint8_t* row = image.pixel(0, y);
        for (int x = 0; x < image.w; ++x) {
            if (row[x * 4 + 3] == 0) continue;
            min_x = std::min(min_x, x);
            max_x = std::max(max_x, x);
            min_y = std::min(min_y, y);
            max_y = std::max(max_y, y);
        }
    }
    if (max_x < 0) return false;
    out.x = min_x;
    out.y = min_y;
    out.w = max_x - min_x + 1;
    out.h = max_y - min_y + 1;
    return true;
}

ImageRGBA rotate_image(const ImageRGBA& image, int angle_degrees) {
    int angle = ((angle_degrees % 360) + 360) % 360;
    switch (angle) {
        case 0: return image;
        case 90: return rotate_90(image, true);
        case 180: return rotate_180(image);
        case 270: return rotate_90(image, false);
        default: break;
    }
    return rotate_about_center(image, static_cast<float>(angle_degrees * M_PI / 180.0));
}

ImageRGBA rotate_90(const ImageRGBA& image, bool clockwise) {
    ImageRGBA rotated(image.h, image.w);
    for (int y = 0; y < image.h; ++y) {
        for (int x = 0; x < image.w; ++x) {
            int dx = clockwise ? image.h - 1 - y : y;
            int dy = clockwise ? x : image.w - 1 - x;
            std::copy_n(image.pixel(x, y), 4, rotated.pixel(dx, dy));
        }
    }
    return rotated;
}

ImageRGBA rotate_180(const ImageRGBA& image) {
    ImageRGBA rotated(image.w, image.h);
    for (int y = 0; y < image.h; ++y) {
        for (int x = 0; x < image.w; ++x) {
            std::copy_n(image.pixel(x, y), 4, rotated.pixel(image.w - 1 - x, image.h - 1 - y));
        }
    }
    return rotated;
}

static void sample_bilinear(const ImageRGBA& image, float sx, float sy, uint8_t* out) {
    if (sx < 0.0f || sy < 0.0f || sx > image.w - 1 || sy > image.h - 1) {
        out[0] = out[1] = out[2] = out[3] = 0;
        return;
    }
    int x0 = static_cast<int>(sx);
    int y0 = static_cast<int>(sy);
    int x1 = std::min(x0 + 1, image.w - 1);
    int y1 = std::min(y0 + 1, image.h - 1);
    float fx = sx - x0;
    float fy = sy - y0;
    const uint8_t* p00 = image.pixel(x0, y0);
    const uint8_t* p10 = image.pixel(x1, y0);
    const uint8_t* p01 = image.pixel(x0, y1);
    const uint8_t* p11 = image.pixel(x1, y1);
    for (int i = 0; i < 4; ++i) {
        float top = p00[i] + (p10[i] - p00[i]) * fx;
        float bottom = p01[i] + (p11[i] - p01[i]) * fx;
        float v = top + (bottom - top) * fy;
        out[i] = static_cast<uint8_t>(std::clamp(static_cast<int>(v + 0.5f), 0, 255));
    }
}

ImageRGBA rotate_about_center(const ImageRGBA& image, float angle_radians) {
    ImageRGBA rotated(image.w, image.h);
    float cx = image.w / 2.0f;
    float cy = image.h / 2.0f;
    float c = std::cos(angle_radians);
    float s = std::sin(angle_radians);
    for (int y = 0; y < image.h; ++y) {
        for (int x = 0; x < image.w; ++x) {
            // inverse mapping: output pixel -> source position
            float dx = x - cx;
            float dy = y - cy;
            float sx = c * dx + s * dy + cx;
            float sy = -s * dx + c * dy + cy;
            sample_bilinear(image, sx, sy, rotated.pixel(x, y));
        }
    }
    return rotated;
}

ImageRGBA resize_exact(const ImageRGBA& image, int w, int h) {
    if (image.w == w && image.h == h) return image;
    ImageRGBA resized(w, h);
    if (image.empty() || w <= 0 || h <= 0) return resized;
    float scale_x = static_cast<float>(image.w) / w;
    float scale_y = static_cast<float>(image.h) / h;
    for (int y = 0; y < h; ++y) {
        float sy = std::clamp((y + 0.5f) * scale_y - 0.5f, 0.0f, static_cast<float>(image.h - 1));
        for (int x = 0; x < w; ++x) {
            float sx = std::clamp((x + 0.5f) * scale_x - 0.5f, 0.0f, static_cast<float>(image.w - 1));
            sample_bilinear(image, sx, sy, resized.pixel(x, y));
        }
    }
    return resized;
}
