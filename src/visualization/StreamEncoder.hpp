#pragma once
#include "FrameCompositor.hpp"
#include <string>
#include <vector>

std::string ansi256_fg(int color_index);
std::string ansi256_bg(int color_index);
std::string ansi_reset();

// One terminal line for a row of cells, without the trailing newline.
// A color directive is written only when the color changes, and the line
// never ends with a style still active.
std::string encode_line(const std::vector<StyledCell>& row, bool use_background);
