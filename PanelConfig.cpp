#include "PanelConfig.h"
#include <nlohmann/json.hpp>
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

static const float MAX_INTERVAL_S = 86400.0f;

const char* to_string(SensorMode mode) {
    switch (mode) {
        case SensorMode::Text: return "text";
        case SensorMode::Fan: return "fan";
        case SensorMode::Progress: return "progress";
        case SensorMode::Pointer: return "pointer";
    }
    return "?";
}

const char* to_string(SensorDirection direction) {
    switch (direction) {
        case SensorDirection::LeftToRight: return "left-to-right";
        case SensorDirection::RightToLeft: return "right-to-left";
        case SensorDirection::TopToBottom: return "top-to-bottom";
        case SensorDirection::BottomToTop: return "bottom-to-top";
    }
    return "?";
}

std::string Panel::FriendlyName() const {
    if (name && !name->empty()) return *name;
    if (id && !id->empty()) return *id;
    if (img && !img->empty()) {
        std::string file = *img;
        size_t slash = file.find_last_of('/');
        if (slash != std::string::npos) file = file.substr(slash + 1);
        size_t dot = file.find_last_of('.');
        if (dot != std::string::npos && dot > 0) file = file.substr(0, dot);
        if (!file.empty()) return file;
    }
    return "panel";
}

const Panel* MonitorConfig::NextActivePanel() {
    std::vector<const Panel*> valid;
    for (uint32_t active : active_panels) {
        if (active == 0) continue;
        if (active > panels.size()) {
            std::cerr << "[Config] Ignoring invalid active panel " << active << std::endl;
            continue;
        }
        valid.push_back(&panels[active - 1]);
    }
    if (valid.empty()) return nullptr;
    const Panel* panel = valid[active_pos_ % valid.size()];
    active_pos_ = (active_pos_ + 1) % valid.size();
    return panel;
}

// --- field helpers: the editor writes "" or -1 for unset values and mixes numbers and strings ---

namespace {

std::optional<std::string> opt_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    std::string s = it->get<std::string>();
    if (trim(s).empty()) return std::nullopt;
    return s;
}

std::optional<double> finite_number(double v, const char* key) {
    if (std::isfinite(v)) return v;
    std::cerr << "[Config] Ignoring non-finite " << key << std::endl;
    return std::nullopt;
}

std::optional<double> opt_number(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (it->is_number()) return finite_number(it->get<double>(), key);
    if (it->is_string()) {
        std::string s = trim(it->get<std::string>());
        if (s.empty()) return std::nullopt;
        try {
            size_t pos = 0;
            double v = std::stod(s, &pos);
            if (pos == s.size()) return finite_number(v, key);
        } catch (const std::exception&) {
        }
        std::cerr << "[Config] Ignoring non-numeric " << key << ": " << s << std::endl;
    }
    return std::nullopt;
}

std::optional<int> opt_int(const json& j, const char* key) {
    auto v = opt_number(j, key);
    if (!v) return std::nullopt;
    if (std::fabs(*v) > std::numeric_limits<int>::max()) {
        std::cerr << "[Config] Ignoring out of range " << key << ": " << *v << std::endl;
        return std::nullopt;
    }
    return static_cast<int>(std::lround(*v));
}

std::optional<float> opt_float(const json& j, const char* key) {
    auto v = opt_number(j, key);
    if (!v) return std::nullopt;
    if (std::fabs(*v) > std::numeric_limits<float>::max()) {
        std::cerr << "[Config] Ignoring out of range " << key << ": " << *v << std::endl;
        return std::nullopt;
    }
    return static_cast<float>(*v);
}

// -1 marks an unset value
std::optional<int> opt_int_unset_minus_one(const json& j, const char* key) {
    auto v = opt_int(j, key);
    if (v && *v == -1) return std::nullopt;
    return v;
}

FontColor parse_font_color(const json& j) {
    FontColor color;
    auto it = j.find("fontColor");
    if (it == j.end() || it->is_null() || it->is_number()) return color;
    if (!it->is_string()) return color;
    std::string s = trim(it->get<std::string>());
    if (s.empty() || s == "-1") return color;
    if (s.size() != 7 || s[0] != '#') {
        std::cerr << "[Config] Invalid font color: " << s << std::endl;
        return color;
    }
    try {
        color.r = static_cast<uint8_t>(std::stoul(s.substr(1, 2), nullptr, 16));
        color.g = static_cast<uint8_t>(std::stoul(s.substr(3, 2), nullptr, 16));
        color.b = static_cast<uint8_t>(std::stoul(s.substr(5, 2), nullptr, 16));
    } catch (const std::exception&) {
        std::cerr << "[Config] Invalid font color: " << s << std::endl;
        return FontColor();
    }
    return color;
}

TextAlign parse_text_align(const json& j) {
    auto align = opt_string(j, "textAlign");
    if (!align || *align == "left") return TextAlign::Left;
    if (*align == "center") return TextAlign::Center;
    if (*align == "right") return TextAlign::Right;
    std::cerr << "[Config] Unknown text alignment '" << *align << "', using left" << std::endl;
    return TextAlign::Left;
}

bool parse_sensor(const json& j, Sensor& sensor) {
    auto label = opt_string(j, "label");
    if (!label) {
        std::cerr << "[Config] Skipping sensor without label" << std::endl;
        return false;
    }
    sensor.label = *label;

    auto mode = opt_int(j, "mode");
    if (!mode || *mode < 1 || *mode > 4) {
        std::cerr << "[Config] Skipping sensor " << sensor.label << ": invalid mode" << std::endl;
        return false;
    }
    sensor.mode = static_cast<SensorMode>(*mode);

    sensor.x = opt_int(j, "x").value_or(0);
    sensor.y = opt_int(j, "y").value_or(0);
    sensor.width = opt_int(j, "width");
    sensor.height = opt_int(j, "height");

    auto direction = opt_int(j, "direction");
    if (direction) {
        if (*direction >= 1 && *direction <= 4) {
            sensor.direction = static_cast<SensorDirection>(*direction);
        } else {
            std::cerr << "[Config] Sensor " << sensor.label << ": ignoring invalid direction "
                      << *direction << std::endl;
        }
    }

    sensor.min_value = opt_float(j, "minValue");
    sensor.max_value = opt_float(j, "maxValue");
    sensor.min_angle = opt_int(j, "minAngle");
    sensor.max_angle = opt_int(j, "maxAngle");
    sensor.pic = opt_string(j, "pic");
    sensor.xz_x = opt_int(j, "xz_x");
    sensor.xz_y = opt_int(j, "xz_y");

    sensor.font_family = opt_string(j, "fontFamily");
    sensor.font_size = opt_int(j, "fontSize");
    sensor.font_color = parse_font_color(j);
    sensor.text_align = parse_text_align(j);
    sensor.integer_digits = IntegerDigits::FromConfig(opt_int(j, "integerDigits").value_or(-1));
    sensor.decimal_digits = opt_int_unset_minus_one(j, "decimalDigits");
    sensor.unit = opt_string(j, "unit");

    sensor.name = opt_string(j, "name");
    if (!sensor.name) sensor.name = opt_string(j, "itemName");
    return true;
}

Panel parse_panel(const json& j) {
    Panel panel;
    panel.id = opt_string(j, "id");
    panel.name = opt_string(j, "name");
    panel.img = opt_string(j, "img");
    auto it = j.find("sensor");
    if (it != j.end() && it->is_array()) {
        for (const auto& js : *it) {
            if (!js.is_object()) continue;
            Sensor sensor;
            if (parse_sensor(js, sensor)) {
                panel.sensors.push_back(std::move(sensor));
            }
        }
    }
    return panel;
}

}  // namespace

MonitorConfig parse_config(const std::string& json_text) {
    json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw ConfigError("Invalid monitor configuration: not a JSON object");
    }

    MonitorConfig config;
    auto setup = root.find("setup");
    if (setup != root.end() && setup->is_object()) {
        config.setup.refresh = opt_float(*setup, "refresh").value_or(1.0f);
        config.setup.switch_time = opt_float(*setup, "switchTime").value_or(5.0f);
    }
    if (config.setup.refresh <= 0.0f) config.setup.refresh = 1.0f;
    if (config.setup.switch_time <= 0.0f) config.setup.switch_time = 5.0f;
    // millisecond timers downstream
    config.setup.refresh = std::min(config.setup.refresh, MAX_INTERVAL_S);
    config.setup.switch_time = std::min(config.setup.switch_time, MAX_INTERVAL_S);

    auto active = root.find("mianban");
    if (active != root.end() && active->is_array()) {
        for (const auto& a : *active) {
            if (a.is_number_integer() && a.get<int64_t>() > 0) {
                config.active_panels.push_back(static_cast<uint32_t>(a.get<int64_t>()));
            }
        }
    }

    auto diy = root.find("diy");
    if (diy != root.end() && diy->is_array()) {
        for (const auto& jp : *diy) {
            if (jp.is_object()) config.panels.push_back(parse_panel(jp));
        }
    }
    return config;
}

MonitorConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to load config " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    MonitorConfig config = parse_config(ss.str());

    std::cout << "[Config] Loaded " << path << ": " << config.panels.size() << " panels, "
              << config.active_panels.size() << " active" << std::endl;
    for (uint32_t active : config.active_panels) {
        if (active == 0 || active > config.panels.size()) continue;
        const Panel& panel = config.panels[active - 1];
        std::cout << "  Panel " << active << ": " << panel.FriendlyName()
                  << " (" << panel.sensors.size() << " sensors)" << std::endl;
    }
    return config;
}
