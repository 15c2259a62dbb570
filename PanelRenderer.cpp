#include "PanelRenderer.h"
#include "DateTimeSensors.h"
#include "FormatValue.h"
#include "utils.h"
#include <algorithm>
#include <cfloat>
#include <chrono>
#include <cmath>
#include <iostream>

static constexpr float DEG_TO_RAD = static_cast<float>(M_PI / 180.0);

const char* to_string(SensorError::Kind kind) {
    switch (kind) {
        case SensorError::Kind::MissingPicture: return "missing picture";
        case SensorError::Kind::ImageLoad: return "image load error";
        case SensorError::Kind::InvalidDirection: return "invalid direction";
        case SensorError::Kind::InvalidValue: return "invalid value";
        case SensorError::Kind::NoFont: return "no font";
    }
    return "unknown";
}

static void set_error(SensorError& error, SensorError::Kind kind, const std::string& message) {
    error.kind = kind;
    error.message = message;
}

float progress_ratio(float value, float min_value, float max_value) {
    if (!(max_value > min_value) || std::isnan(value)) return 0.0f;
    float clamped = std::clamp(value, min_value, max_value);
    float ratio = (clamped - min_value) / (max_value - min_value);
    if (!std::isfinite(ratio)) return 0.0f;
    return std::clamp(ratio, 0.0f, 1.0f);
}

std::optional<FanSector> fan_sector(const Sensor& sensor, float value) {
    float min_angle = static_cast<float>(sensor.min_angle.value_or(0));
    float max_angle = static_cast<float>(sensor.max_angle.value_or(180));
    float min_value = sensor.min_value.value_or(0.0f);
    float max_value = sensor.max_value.value_or(100.0f);

    if (value <= min_value) return std::nullopt;
    float progress = value >= max_value ? 1.0f : progress_ratio(value, min_value, max_value);
    float sweep = (max_angle - min_angle) * progress;

    FanSector sector;
    if (sensor.direction.value_or(SensorDirection::LeftToRight) == SensorDirection::LeftToRight) {
        sector.start_deg = min_angle - 90.0f;
        sector.end_deg = min_angle + sweep - 90.0f;
    } else {
        sector.start_deg = 360.0f - min_angle - sweep - 90.0f;
        sector.end_deg = 360.0f - min_angle - 90.0f;
    }
    return sector;
}

void draw_pie_slice(ImageRGBA& layer, const ImageRGBA& source, int center_x, int center_y,
                    float start_deg, float end_deg) {
    const float two_pi = static_cast<float>(2.0 * M_PI);
    float radius = std::min(source.w, source.h) / 2.0f;
    float start = std::fmod(start_deg, 360.0f) * DEG_TO_RAD;
    float end = std::fmod(end_deg, 360.0f) * DEG_TO_RAD;
    if (start < 0.0f) start += two_pi;
    if (end < 0.0f) end += two_pi;

    auto in_sector = [&](float a) {
        if (a < 0.0f) a += two_pi;
        if (end < start) return a >= start || a <= end;  // wraps through 0
        return a >= start && a <= end;
    };

    float half_w = source.w / 2.0f;
    float half_h = source.h / 2.0f;
    for (int sy = 0; sy < source.h; ++sy) {
        for (int sx = 0; sx < source.w; ++sx) {
            float dx = sx - half_w;
            float dy = sy - half_h;
            if (std::sqrt(dx * dx + dy * dy) > radius) continue;
            if (!in_sector(std::atan2(dy, dx))) continue;
            int dest_x = center_x + sx - source.w / 2;
            int dest_y = center_y + sy - source.h / 2;
            if (!layer.contains(dest_x, dest_y)) continue;
            blend_over(layer.pixel(dest_x, dest_y), source.pixel(sx, sy));
        }
    }
}

void apply_progress_mask(ImageRGBA& image, SensorDirection direction, float progress) {
    int crop_w = static_cast<int>(std::lround(image.w * progress));
    int crop_h = static_cast<int>(std::lround(image.h * progress));
    for (int y = 0; y < image.h; ++y) {
        for (int x = 0; x < image.w; ++x) {
            bool keep = true;
            switch (direction) {
                case SensorDirection::LeftToRight: keep = x < crop_w; break;
                case SensorDirection::RightToLeft: keep = x >= image.w - crop_w; break;
                case SensorDirection::TopToBottom: keep = y < crop_h; break;
                case SensorDirection::BottomToTop: keep = y >= image.h - crop_h; break;
            }
            if (!keep) image.pixel(x, y)[3] = 0;
        }
    }
}

std::string sensor_unit(const Sensor& sensor, const SensorValues& values) {
    auto it = values.find(sensor.label + "#unit");
    if (it != values.end()) return it->second;
    return sensor.unit.value_or("");
}

std::string sensor_text(const Sensor& sensor, const std::string& value, const std::string& unit) {
    return format_value(value, sensor.integer_digits, sensor.decimal_digits.value_or(0), unit);
}

PanelRenderer::PanelRenderer(int width, int height, const std::string& font_dir,
                             const std::string& img_dir, const std::string& default_font)
    : width_(width), height_(height), fonts_(font_dir, default_font), images_(img_dir) {
    debug_ = getenv_bool("ASTER_DEBUG", false);
}

void PanelRenderer::clearCaches() {
    fonts_.clear();
    images_.clear();
}

ImageRGBA PanelRenderer::render(const Panel& panel, const SensorValues& values, RenderReport& report) {
    return render(panel, values, report, local_now());
}

ImageRGBA PanelRenderer::render(const Panel& panel, const SensorValues& values, RenderReport& report,
                                const std::tm& now) {
    auto start = std::chrono::steady_clock::now();

    ImageRGBA frame;
    const ImageRGBA* background =
        panel.img ? images_.Get(*panel.img, std::make_pair(width_, height_)) : nullptr;
    if (background) {
        frame = *background;
    } else {
        frame = ImageRGBA(width_, height_);
    }
    for (auto& l : layers_) l.reset();

    for (size_t i = 0; i < panel.sensors.size(); ++i) {
        const Sensor& sensor = panel.sensors[i];

        std::string value;
        auto it = values.find(sensor.label);
        if (it != values.end()) {
            value = it->second;
        } else if (auto date = date_time_value(sensor.label, now)) {
            value = *date;
        } else {
            continue;
        }

        SensorError error;
        if (!renderSensor(frame, sensor, value, sensor_unit(sensor, values), error)) {
            error.index = i;
            error.label = sensor.label;
            std::cerr << "[Render] Sensor " << i << " (" << sensor.label << ", "
                      << to_string(sensor.mode) << "): " << to_string(error.kind) << ": "
                      << error.message << std::endl;
            report.errors.push_back(std::move(error));
        }
    }

    compositeLayers(frame);
    for (auto& l : layers_) l.reset();

    if (debug_) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        std::cout << "[Render] Rendered panel " << panel.FriendlyName() << " in " << ms << "ms"
                  << std::endl;
    }
    return frame;
}

bool PanelRenderer::renderSensor(ImageRGBA& frame, const Sensor& sensor, const std::string& value,
                                 const std::string& unit, SensorError& error) {
    switch (sensor.mode) {
        case SensorMode::Text: return renderText(frame, sensor, value, unit, error);
        case SensorMode::Fan: return renderFan(sensor, value, error);
        case SensorMode::Progress: return renderProgress(sensor, value, error);
        case SensorMode::Pointer: return renderPointer(sensor, value, error);
    }
    return true;
}

bool PanelRenderer::layoutText(const Sensor& sensor, const std::string& value,
                               const std::string& unit, TextLayout& layout, SensorError& error) {
    const Font* font = sensor.font_family ? fonts_.Get(*sensor.font_family) : fonts_.Default();
    if (!font) {
        set_error(error, SensorError::Kind::NoFont, "no usable font");
        return false;
    }
    float points = static_cast<float>(sensor.font_size.value_or(14));
    float scale = font_scale_for_points(*font, points * text_scale_);

    layout.text = sensor_text(sensor, value, unit);
    layout.size = measure_text(*font, scale, layout.text);
    int width = sensor.width.value_or(0);
    int height = sensor.height.value_or(0);
    switch (sensor.text_align) {
        case TextAlign::Left: layout.x = sensor.x; break;
        case TextAlign::Center: layout.x = sensor.x + width / 2 - layout.size.w / 2; break;
        case TextAlign::Right: layout.x = sensor.x + width - layout.size.w; break;
    }
    // text is placed with its full (unscaled) height centered on the box
    layout.y = sensor.y + height / 2 - static_cast<int>(layout.size.h * 1.3333f / 2.0f);
    return true;
}

bool PanelRenderer::renderText(ImageRGBA& frame, const Sensor& sensor, const std::string& value,
                               const std::string& unit, SensorError& error) {
    TextLayout layout;
    if (!layoutText(sensor, value, unit, layout, error)) return false;
    const Font* font = sensor.font_family ? fonts_.Get(*sensor.font_family) : fonts_.Default();
    const stbtt_fontinfo* info = &font->info;
    float scale = font_scale_for_points(*font, sensor.font_size.value_or(14) * text_scale_);

    if (debug_) {
        std::cout << "[Render] Sensor(" << sensor.x << "," << sensor.y << "), pixel(" << layout.x
                  << "," << layout.y << "), size(" << layout.size.w << "," << layout.size.h
                  << "): " << layout.text << std::endl;
    }

    int ascent, descent, line_gap;
    stbtt_GetFontVMetrics(info, &ascent, &descent, &line_gap);
    int baseline = layout.y + static_cast<int>(std::lround(ascent * scale));
    float pen_x = static_cast<float>(layout.x);
    uint8_t color[4] = {sensor.font_color.r, sensor.font_color.g, sensor.font_color.b, 0};

    std::vector<uint8_t> bitmap;
    int prev = 0;
    for (size_t i = 0; i < layout.text.size();) {
        int cp = static_cast<int>(utf8_next(layout.text, i));
        if (prev) pen_x += stbtt_GetCodepointKernAdvance(info, prev, cp) * scale;
        int advance, lsb;
        stbtt_GetCodepointHMetrics(info, cp, &advance, &lsb);
        int x0, y0, x1, y1;
        stbtt_GetCodepointBitmapBox(info, cp, scale, scale, &x0, &y0, &x1, &y1);
        int w = x1 - x0;
        int h = y1 - y0;
        if (w > 0 && h > 0) {
            bitmap.assign(static_cast<size_t>(w) * h, 0);
            stbtt_MakeCodepointBitmap(info, bitmap.data(), w, h, w, scale, scale, cp);
            int gx = static_cast<int>(std::lround(pen_x)) + x0;
            int gy = baseline + y0;
            for (int j = 0; j < h; ++j) {
                for (int k = 0; k < w; ++k) {
                    uint8_t coverage = bitmap[static_cast<size_t>(j) * w + k];
                    if (coverage == 0 || !frame.contains(gx + k, gy + j)) continue;
                    color[3] = coverage;
                    blend_over(frame.pixel(gx + k, gy + j), color);
                }
            }
        }
        pen_x += advance * scale;
        prev = cp;
    }
    return true;
}

const ImageRGBA* PanelRenderer::sensorPicture(const Sensor& sensor, SensorError& error,
                                              std::optional<std::pair<int, int>> size) {
    if (!sensor.pic) {
        set_error(error, SensorError::Kind::MissingPicture, "no picture specified");
        return nullptr;
    }
    const ImageRGBA* pic = images_.Get(*sensor.pic, size);
    if (!pic) {
        set_error(error, SensorError::Kind::ImageLoad, "failed to load " + *sensor.pic);
    }
    return pic;
}

static bool parse_sensor_value(const std::string& value, float& out, SensorError& error) {
    double v;
    if (!parse_number(value, v) || !std::isfinite(v)) {
        set_error(error, SensorError::Kind::InvalidValue, "invalid value '" + value + "'");
        return false;
    }
    out = static_cast<float>(std::clamp(v, static_cast<double>(-FLT_MAX), static_cast<double>(FLT_MAX)));
    return true;
}

static bool check_angular_direction(const Sensor& sensor, SensorError& error) {
    SensorDirection direction = sensor.direction.value_or(SensorDirection::LeftToRight);
    if (direction == SensorDirection::LeftToRight || direction == SensorDirection::RightToLeft) {
        return true;
    }
    set_error(error, SensorError::Kind::InvalidDirection,
              std::string("direction ") + to_string(direction) + " not supported");
    return false;
}

bool PanelRenderer::renderFan(const Sensor& sensor, const std::string& value, SensorError& error) {
    if (!check_angular_direction(sensor, error)) return false;
    const ImageRGBA* pic = sensorPicture(sensor, error);
    if (!pic) return false;
    float current;
    if (!parse_sensor_value(value, current, error)) return false;

    auto sector = fan_sector(sensor, current);
    if (!sector) return true;
    draw_pie_slice(layer(SensorMode::Fan), *pic, sensor.x, sensor.y, sector->start_deg,
                   sector->end_deg);
    return true;
}

bool PanelRenderer::renderProgress(const Sensor& sensor, const std::string& value,
                                   SensorError& error) {
    const ImageRGBA* pic = sensorPicture(sensor, error);
    if (!pic) return false;
    float current;
    if (!parse_sensor_value(value, current, error)) return false;

    float progress = progress_ratio(current, sensor.min_value.value_or(0.0f),
                                    sensor.max_value.value_or(100.0f));
    ImageRGBA masked = *pic;
    apply_progress_mask(masked, sensor.direction.value_or(SensorDirection::LeftToRight), progress);
    paste_image(layer(SensorMode::Progress), masked, sensor.x, sensor.y);
    return true;
}

bool PanelRenderer::renderPointer(const Sensor& sensor, const std::string& value,
                                  SensorError& error) {
    if (!check_angular_direction(sensor, error)) return false;

    std::optional<std::pair<int, int>> size;
    if (sensor.width && sensor.height) size = std::make_pair(*sensor.width, *sensor.height);
    const ImageRGBA* pic = sensorPicture(sensor, error, size);
    if (!pic) return false;
    float current;
    if (!parse_sensor_value(value, current, error)) return false;

    float progress = progress_ratio(current, sensor.min_value.value_or(0.0f),
                                    sensor.max_value.value_or(100.0f));
    float min_angle = static_cast<float>(sensor.min_angle.value_or(0));
    float max_angle = static_cast<float>(sensor.max_angle.value_or(360));
    if (sensor.direction == SensorDirection::RightToLeft) {
        min_angle = -min_angle;
        max_angle = -max_angle;
    }
    float angle = min_angle + progress * (max_angle - min_angle);
    float rad = angle * DEG_TO_RAD;

    float xz_x = static_cast<float>(sensor.xz_x.value_or(0));
    float xz_y = static_cast<float>(sensor.xz_y.value_or(0));
    int offset_x = static_cast<int>(xz_x * std::cos(rad) - xz_y * std::sin(rad));
    int offset_y = static_cast<int>(xz_x * std::sin(rad) + xz_y * std::cos(rad));

    ImageRGBA rotated = rotate_image(*pic, -static_cast<int>(std::lround(angle)));
    int final_x = sensor.x + offset_x - rotated.w / 2;
    int final_y = sensor.y + offset_y - rotated.h / 2;
    paste_image(layer(SensorMode::Pointer), rotated, final_x, final_y);
    return true;
}

ImageRGBA& PanelRenderer::layer(SensorMode mode) {
    size_t index = 0;
    switch (mode) {
        case SensorMode::Fan: index = 0; break;
        case SensorMode::Progress: index = 1; break;
        case SensorMode::Pointer: index = 2; break;
        case SensorMode::Text: break;
    }
    if (!layers_[index]) layers_[index] = ImageRGBA(width_, height_);
    return *layers_[index];
}

void PanelRenderer::compositeLayers(ImageRGBA& frame) {
    for (const auto& l : layers_) {
        if (!l) continue;
        Rect box;
        if (!opaque_bounds(*l, box)) continue;
        for (int y = box.y; y < box.y + box.h; ++y) {
            for (int x = box.x; x < box.x + box.w; ++x) {
                const uint8_t* src = l->pixel(x, y);
                if (src[3] == 0 || !frame.contains(x, y)) continue;
                blend_over(frame.pixel(x, y), src);
            }
        }
    }
}
