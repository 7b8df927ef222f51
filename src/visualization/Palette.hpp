#pragma once
#include "PixelGrid.hpp"
#include <array>
#include <cstdint>
#include <cstddef>
#include <unordered_map>

struct RGBA {
    uint8_t r, g, b, a;
};

namespace Palettes {
    // xterm 256-color table: 0-15 system, 16-231 6x6x6 cube, 232-255 gray ramp.
    extern const std::array<RGBA, 256> ID2RGBA;
}

constexpr int PALETTE_BLACK = 16;
constexpr int PALETTE_WHITE = 231;
constexpr int GRAY_RAMP_START = 232;

// Maps an RGB triple onto the 256-color cube or gray ramp. Result is in [16,255].
// Rounding is half-to-even; integer channels never produce an exact tie.
int rgb_to_ansi256(uint8_t r, uint8_t g, uint8_t b);

inline int rgb_to_ansi256(const RGB& c) {
    return rgb_to_ansi256(c.r, c.g, c.b);
}

// Memoizes rgb_to_ansi256 for one render. Not thread-safe; give each worker its own.
class PaletteCache {
public:
    int lookup(const RGB& c);

    size_t size() const { return cache.size(); }
    size_t get_hits() const { return hits; }
    size_t get_misses() const { return misses; }

private:
    std::unordered_map<uint32_t, int> cache;
    size_t hits = 0;
    size_t misses = 0;
};
