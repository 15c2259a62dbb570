#ifndef FONT_CACHE_H
#define FONT_CACHE_H

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <stb_truetype.h>

struct Font {
    std::vector<uint8_t> buffer;  // must outlive `info`
    stbtt_fontinfo info;
};

// Pixel extent of a laid out string: width from the pen origin, height from the top
// of the line (ascent) to the lowest glyph pixel.
struct TextSize {
    int w = 0;
    int h = 0;
};

// TTF fonts by family name, loaded from `<font_dir>/<family>.ttf`.
class FontCache {
public:
    FontCache(const std::string& font_dir, const std::string& default_font_path);

    // Returns the default font if the family can't be loaded; nullptr if that fails too.
    const Font* Get(const std::string& family);
    const Font* Default();
    void clear();

private:
    std::string font_dir_;
    std::string default_font_path_;
    std::unordered_map<std::string, std::unique_ptr<Font>> fonts_;
    std::unique_ptr<Font> default_font_;
    bool default_failed_ = false;
};

std::unique_ptr<Font> load_font(const std::string& path);

// stb_truetype scale for a point size at 96 dpi.
float font_scale_for_points(const Font& font, float points);

TextSize measure_text(const Font& font, float scale, const std::string& text);

#endif // FONT_CACHE_H
