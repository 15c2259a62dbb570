#include "ImageCache.h"
#include <cstring>
#include <iostream>

#include <stb_image.h>

bool load_image(const std::string& path, ImageRGBA& out) {
    int w, h, channels;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!data) {
        std::cerr << "[Render] Failed to load image " << path << ": " << stbi_failure_reason()
                  << std::endl;
        return false;
    }
    out = ImageRGBA(w, h);
    std::memcpy(out.data.data(), data, out.data.size());
    stbi_image_free(data);
    return true;
}

ImageCache::ImageCache(const std::string& img_dir) : img_dir_(img_dir) {}

const ImageRGBA* ImageCache::Get(const std::string& path, std::optional<std::pair<int, int>> size) {
    std::string full = (!path.empty() && path[0] == '/') || img_dir_.empty()
                           ? path
                           : img_dir_ + "/" + path;
    Key key{full, size ? size->first : -1, size ? size->second : -1};

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        std::optional<ImageRGBA> entry;
        ImageRGBA img;
        if (load_image(full, img)) {
            if (size && (img.w != size->first || img.h != size->second) &&
                size->first > 0 && size->second > 0) {
                std::cerr << "[Render] Image " << full << " is " << img.w << "x" << img.h
                          << ", resizing to " << size->first << "x" << size->second << std::endl;
                img = resize_exact(img, size->first, size->second);
            }
            entry = std::move(img);
        }
        it = cache_.emplace(key, std::move(entry)).first;
    }
    return it->second ? &*it->second : nullptr;
}
