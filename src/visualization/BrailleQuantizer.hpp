#pragma once
#include "PixelGrid.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

constexpr int BLOCK_COLS = 2;
constexpr int BLOCK_ROWS = 4;
constexpr int BLOCK_SIZE = BLOCK_COLS * BLOCK_ROWS;

constexpr char32_t BRAILLE_BASE = 0x2800;
constexpr double BRIGHTNESS_THRESHOLD = 128.0;

// Samples of one 2x4 cell, index py * 2 + px.
using Block = std::array<std::optional<RGB>, BLOCK_SIZE>;

// Braille dot numbering:
//   0 3
//   1 4
//   2 5
//   6 7
// Entry i is the output bit for block sample i.
extern const std::array<int, BLOCK_SIZE> BRAILLE_BIT_FOR_SAMPLE;

// BT.709 luma
double brightness(const RGB& c);

uint8_t quantize(const Block& block);

inline char32_t braille_glyph(uint8_t pattern) {
    return BRAILLE_BASE + pattern;
}

void append_utf8(std::string& out, char32_t codepoint);
