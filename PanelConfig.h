#ifndef PANEL_CONFIG_H
#define PANEL_CONFIG_H

#include "FormatValue.h"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class SensorMode {
    Text = 1,
    Fan = 2,       // circular/arc gauge
    Progress = 3,  // horizontal or vertical bar
    Pointer = 4,   // rotating dial
};

// LeftToRight doubles as clockwise and RightToLeft as counter-clockwise for Fan and Pointer.
enum class SensorDirection {
    LeftToRight = 1,
    RightToLeft = 2,
    TopToBottom = 3,
    BottomToTop = 4,
};

enum class TextAlign {
    Left,
    Center,
    Right,
};

struct FontColor {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
};

const char* to_string(SensorMode mode);
const char* to_string(SensorDirection direction);

// One visual element of a panel.
struct Sensor {
    std::string label;
    SensorMode mode = SensorMode::Text;
    int x = 0;
    int y = 0;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<SensorDirection> direction;

    std::optional<float> min_value;
    std::optional<float> max_value;
    std::optional<int> min_angle;
    std::optional<int> max_angle;

    std::optional<std::string> pic;
    std::optional<int> xz_x;
    std::optional<int> xz_y;

    std::optional<std::string> font_family;
    std::optional<int> font_size;
    FontColor font_color;
    TextAlign text_align = TextAlign::Left;
    IntegerDigits integer_digits;
    std::optional<int> decimal_digits;
    std::optional<std::string> unit;

    // Display name from the editor, informational only.
    std::optional<std::string> name;
};

struct Panel {
    std::optional<std::string> id;
    std::optional<std::string> name;
    std::optional<std::string> img;
    std::vector<Sensor> sensors;

    std::string FriendlyName() const;
};

struct Setup {
    float refresh = 1.0f;       // seconds between redraws
    float switch_time = 5.0f;   // seconds per panel
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Monitor configuration as written by the vendor's panel editor.
class MonitorConfig {
public:
    Setup setup;
    std::vector<uint32_t> active_panels;  // 1-based indexes into `panels`
    std::vector<Panel> panels;

    // Cycle through the valid active panels. Returns nullptr if there is none.
    const Panel* NextActivePanel();

private:
    size_t active_pos_ = 0;
};

// Throw ConfigError on I/O or JSON syntax errors.
MonitorConfig load_config(const std::string& path);
MonitorConfig parse_config(const std::string& json_text);

#endif // PANEL_CONFIG_H
