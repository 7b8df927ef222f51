#include "PixelGrid.hpp"
#include <algorithm>

void PixelGrid::set(int x, int y, RGB color) {
    pixels[key(x, y)] = color;
    max_x = std::max(max_x, x);
    max_y = std::max(max_y, y);
}

bool PixelGrid::get(int x, int y, RGB& out) const {
    if (x < 0 || y < 0) return false;
    auto it = pixels.find(key(x, y));
    if (it == pixels.end()) return false;
    out = it->second;
    return true;
}

bool PixelGrid::contains(int x, int y) const {
    if (x < 0 || y < 0) return false;
    return pixels.count(key(x, y)) != 0;
}

PixelGrid PixelGrid::inverted() const {
    PixelGrid out;
    out.pixels.reserve(pixels.size());
    for (const auto& kv : pixels) {
        const RGB& c = kv.second;
        out.pixels[kv.first] = {(uint8_t)(255 - c.r), (uint8_t)(255 - c.g), (uint8_t)(255 - c.b)};
    }
    out.max_x = max_x;
    out.max_y = max_y;
    return out;
}
