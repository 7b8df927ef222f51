#include "Palette.hpp"
#include <algorithm>
#include <cmath>

static std::array<RGBA, 256> build_xterm_table() {
    static const uint8_t levels[6] = {0, 95, 135, 175, 215, 255};
    std::array<RGBA, 256> t{};

    const RGBA system_colors[16] = {
        {0, 0, 0, 255},       {205, 0, 0, 255},     {0, 205, 0, 255},     {205, 205, 0, 255},
        {0, 0, 238, 255},     {205, 0, 205, 255},   {0, 205, 205, 255},   {229, 229, 229, 255},
        {127, 127, 127, 255}, {255, 0, 0, 255},     {0, 255, 0, 255},     {255, 255, 0, 255},
        {92, 92, 255, 255},   {255, 0, 255, 255},   {0, 255, 255, 255},   {255, 255, 255, 255},
    };
    for (int i = 0; i < 16; i++) t[i] = system_colors[i];

    for (int i = 16; i < GRAY_RAMP_START; i++) {
        int idx = i - 16;
        t[i] = {levels[idx / 36], levels[(idx % 36) / 6], levels[idx % 6], 255};
    }

    for (int i = GRAY_RAMP_START; i < 256; i++) {
        uint8_t shade = (uint8_t)(8 + (i - GRAY_RAMP_START) * 10);
        t[i] = {shade, shade, shade, 255};
    }
    return t;
}

const std::array<RGBA, 256> Palettes::ID2RGBA = build_xterm_table();

// --- Mapping ---

static int cube_level(uint8_t c) {
    int level = (int)std::nearbyint(c / 51.0);
    return std::clamp(level, 0, 5);
}

int rgb_to_ansi256(uint8_t r, uint8_t g, uint8_t b) {
    if (r == g && g == b) {
        if (r < 8) return PALETTE_BLACK;
        if (r > 248) return PALETTE_WHITE;
        return (int)std::nearbyint((r - 8) / 247.0 * 24.0) + GRAY_RAMP_START;
    }
    return 16 + 36 * cube_level(r) + 6 * cube_level(g) + cube_level(b);
}

// --- Cache ---

int PaletteCache::lookup(const RGB& c) {
    uint32_t key = ((uint32_t)c.r << 16) | ((uint32_t)c.g << 8) | c.b;
    auto it = cache.find(key);
    if (it != cache.end()) {
        hits++;
        return it->second;
    }
    misses++;
    int idx = rgb_to_ansi256(c);
    cache.emplace(key, idx);
    return idx;
}
