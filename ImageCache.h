#ifndef IMAGE_CACHE_H
#define IMAGE_CACHE_H

#include "Image.h"
#include <map>
#include <optional>
#include <string>
#include <utility>

// Decode a PNG/JPEG/BMP/... file into RGBA. Returns false and logs on failure.
bool load_image(const std::string& path, ImageRGBA& out);

// Decoded images by path and requested size. Failed loads are cached as well so a
// missing file is reported once.
class ImageCache {
public:
    explicit ImageCache(const std::string& img_dir);

    // Relative paths are resolved against the image directory. If `size` is given
    // and differs from the image, it is stretched to exactly that size.
    const ImageRGBA* Get(const std::string& path,
                         std::optional<std::pair<int, int>> size = std::nullopt);
    void clear() { cache_.clear(); }
    size_t size() const { return cache_.size(); }

private:
    struct Key {
        std::string path;
        int w;
        int h;
        bool operator<(const Key& o) const {
            if (path != o.path) return path < o.path;
            if (w != o.w) return w < o.w;
            return h < o.h;
        }
    };

    std::string img_dir_;
    std::map<Key, std::optional<ImageRGBA>> cache_;
};

#endif // IMAGE_CACHE_H
