#ifndef PANEL_RENDERER_H
#define PANEL_RENDERER_H

#include "FontCache.h"
#include "Image.h"
#include "ImageCache.h"
#include "PanelConfig.h"
#include "SensorStore.h"
#include <array>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

struct SensorError {
    enum class Kind {
        MissingPicture,
        ImageLoad,
        InvalidDirection,
        InvalidValue,
        NoFont,
    };

    size_t index = 0;  // position in Panel::sensors
    std::string label;
    Kind kind = Kind::InvalidValue;
    std::string message;
};

const char* to_string(SensorError::Kind kind);

// Per-sensor failures of one render pass. The rendered image is still usable.
struct RenderReport {
    std::vector<SensorError> errors;

    bool ok() const { return errors.empty(); }
};

// Sector in degrees, 0 at 3 o'clock, increasing clockwise.
struct FanSector {
    float start_deg = 0.0f;
    float end_deg = 0.0f;
};

struct TextLayout {
    std::string text;
    int x = 0;  // pen origin, top of the line
    int y = 0;
    TextSize size;
};

// (value - min) / (max - min) clamped to [0, 1]. An empty range gives 0.
float progress_ratio(float value, float min_value, float max_value);

// Sector to cut from a Fan sensor picture, nullopt if nothing is drawn (value <= min).
// Direction must be LeftToRight or RightToLeft.
std::optional<FanSector> fan_sector(const Sensor& sensor, float value);

// Blend the pixels of `source` within its inscribed circle and inside [start, end] onto
// `layer`, with the source centered at (center_x, center_y).
void draw_pie_slice(ImageRGBA& layer, const ImageRGBA& source, int center_x, int center_y,
                    float start_deg, float end_deg);

// Make every pixel outside the `progress` share of the image (along `direction`) transparent.
void apply_progress_mask(ImageRGBA& image, SensorDirection direction, float progress);

// Unit of a sensor: the "<label>#unit" value if present, else the configured unit.
std::string sensor_unit(const Sensor& sensor, const SensorValues& values);

// Formatted text of a Text sensor.
std::string sensor_text(const Sensor& sensor, const std::string& value, const std::string& unit);

// Renders panels of one display size. Fonts and images are cached across calls.
class PanelRenderer {
public:
    PanelRenderer(int width, int height, const std::string& font_dir, const std::string& img_dir,
                  const std::string& default_font);

    // Render a panel with the given values. Sensors without a value are skipped, except
    // DATE_* labels which are computed from `now`.
    ImageRGBA render(const Panel& panel, const SensorValues& values, RenderReport& report);
    ImageRGBA render(const Panel& panel, const SensorValues& values, RenderReport& report,
                     const std::tm& now);

    // Point size multiplier for text sensors.
    void setTextScale(float scale) { text_scale_ = scale; }
    float textScale() const { return text_scale_; }

    bool layoutText(const Sensor& sensor, const std::string& value, const std::string& unit,
                    TextLayout& layout, SensorError& error);

    void clearCaches();

    int width() const { return width_; }
    int height() const { return height_; }

private:
    bool renderSensor(ImageRGBA& frame, const Sensor& sensor, const std::string& value,
                      const std::string& unit, SensorError& error);
    bool renderText(ImageRGBA& frame, const Sensor& sensor, const std::string& value,
                    const std::string& unit, SensorError& error);
    bool renderFan(const Sensor& sensor, const std::string& value, SensorError& error);
    bool renderProgress(const Sensor& sensor, const std::string& value, SensorError& error);
    bool renderPointer(const Sensor& sensor, const std::string& value, SensorError& error);

    const ImageRGBA* sensorPicture(const Sensor& sensor, SensorError& error,
                                   std::optional<std::pair<int, int>> size = std::nullopt);
    ImageRGBA& layer(SensorMode mode);
    void compositeLayers(ImageRGBA& frame);

    int width_;
    int height_;
    FontCache fonts_;
    ImageCache images_;
    // Fan, Progress, Pointer in compositing order
    std::array<std::optional<ImageRGBA>, 3> layers_;
    float text_scale_ = 0.75f;
    bool debug_ = false;
};

#endif // PANEL_RENDERER_H
