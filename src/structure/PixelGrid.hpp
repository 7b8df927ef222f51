#pragma once
#include <cstdint>
#include <cstddef>
#include <unordered_map>

struct RGB {
    uint8_t r, g, b;
};

inline bool operator==(const RGB& a, const RGB& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const RGB& a, const RGB& b) {
    return !(a == b);
}

// Sparse (x, y) -> RGB mapping of decoded samples.
// max_x / max_y track the extent of present coordinates only.
class PixelGrid {
public:
    void set(int x, int y, RGB color);
    bool get(int x, int y, RGB& out) const;
    bool contains(int x, int y) const;

    bool empty() const { return pixels.empty(); }
    size_t size() const { return pixels.size(); }
    int get_max_x() const { return max_x; }
    int get_max_y() const { return max_y; }

    PixelGrid inverted() const;

private:
    static uint64_t key(int x, int y) {
        return ((uint64_t)(uint32_t)y << 32) | (uint32_t)x;
    }

    std::unordered_map<uint64_t, RGB> pixels;
    int max_x = 0;
    int max_y = 0;
};
