#pragma once
#include "PixelGrid.hpp"
#include <string>

// Reads ImageMagick's "txt:" pixel enumeration:
//   X,Y: (R,G,B[,A])  #RRGGBB  name
// Channels are integers or percentages. Blank lines and '#' comments are
// ignored; lines that fail to parse are skipped without touching the grid.
PixelGrid parse_pixel_text(const std::string& text);

// Largest accepted x or y; lines beyond it are treated as malformed.
constexpr long MAX_PIXEL_COORDINATE = 1L << 20;

bool parse_pixel_line(const std::string& line, int& x, int& y, RGB& color);

// round(pct * 255 / 100), half away from zero, clamped to [0,255]
uint8_t percent_to_channel(double pct);
