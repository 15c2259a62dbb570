#include "FontCache.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

std::unique_ptr<Font> load_font(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        std::cerr << "[Render] Failed to open font file: " << path << std::endl;
        return nullptr;
    }
    std::streamsize file_size = file.tellg();
    file.seekg(0, std::ios::beg);
    auto font = std::make_unique<Font>();
    font->buffer.resize(static_cast<size_t>(file_size));
    if (!file.read(reinterpret_cast<char*>(font->buffer.data()), file_size)) {
        std::cerr << "[Render] Failed to read font file: " << path << std::endl;
        return nullptr;
    }
    int offset = stbtt_GetFontOffsetForIndex(font->buffer.data(), 0);
    if (offset < 0 || !stbtt_InitFont(&font->info, font->buffer.data(), offset)) {
        std::cerr << "[Render] Failed to initialize font: " << path << std::endl;
        return nullptr;
    }
    return font;
}

float font_scale_for_points(const Font& font, float points) {
    return stbtt_ScaleForMappingEmToPixels(&font.info, points * 96.0f / 72.0f);
}

TextSize measure_text(const Font& font, float scale, const std::string& text) {
    int ascent, descent, line_gap;
    stbtt_GetFontVMetrics(&font.info, &ascent, &descent, &line_gap);
    float baseline = ascent * scale;

    TextSize size;
    float pen_x = 0.0f;
    int prev = 0;
    for (size_t i = 0; i < text.size();) {
        int cp = static_cast<int>(utf8_next(text, i));
        if (prev) pen_x += stbtt_GetCodepointKernAdvance(&font.info, prev, cp) * scale;
        int advance, lsb;
        stbtt_GetCodepointHMetrics(&font.info, cp, &advance, &lsb);
        int x0, y0, x1, y1;
        stbtt_GetCodepointBitmapBox(&font.info, cp, scale, scale, &x0, &y0, &x1, &y1);
        if (x1 > x0 && y1 > y0) {
            size.w = std::max(size.w, static_cast<int>(std::lround(pen_x)) + x1);
            size.h = std::max(size.h, static_cast<int>(std::lround(baseline)) + y1);
        }
        pen_x += advance * scale;
        prev = cp;
    }
    return size;
}

FontCache::FontCache(const std::string& font_dir, const std::string& default_font_path)
    : font_dir_(font_dir), default_font_path_(default_font_path) {}

const Font* FontCache::Default() {
    if (!default_font_ && !default_failed_) {
        default_font_ = load_font(default_font_path_);
        default_failed_ = !default_font_;
    }
    return default_font_.get();
}

const Font* FontCache::Get(const std::string& family) {
    auto it = fonts_.find(family);
    if (it == fonts_.end()) {
        std::string path = font_dir_ + "/" + family + ".ttf";
        auto font = load_font(path);
        if (!font) {
            std::cerr << "[Render] Failed to load font " << family << ". Using default" << std::endl;
        }
        it = fonts_.emplace(family, std::move(font)).first;
    }
    if (it->second) return it->second.get();
    return Default();
}

void FontCache::clear() {
    fonts_.clear();
    default_font_.reset();
    default_failed_ = false;
}
