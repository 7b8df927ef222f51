#pragma once
#include "PixelGrid.hpp"
#include "Palette.hpp"
#include "BrailleQuantizer.hpp"
#include <optional>
#include <vector>

struct StyledCell {
    char32_t glyph = U' ';
    std::optional<int> color;  // palette index, empty for a blank cell
};

inline bool operator==(const StyledCell& a, const StyledCell& b) {
    return a.glyph == b.glyph && a.color == b.color;
}

struct Frame {
    int char_width = 0;
    int char_height = 0;
    std::vector<std::vector<StyledCell>> rows;
};

// Character grid covering (max_x+1) x (max_y+1) pixels, partial blocks included.
int char_columns(int max_x);
int char_rows(int max_y);

Block gather_block(const PixelGrid& grid, int char_x, int char_y);
StyledCell compose_cell(const PixelGrid& grid, int char_x, int char_y, PaletteCache& cache);

Frame compose(const PixelGrid& grid, PaletteCache& cache);

// Fills rows stripe, stripe + stripes, ... of a frame already sized for grid.
void compose_stripe(const PixelGrid& grid, Frame& frame, int stripe, int stripes, PaletteCache& cache);

// Same result as compose(), rows split over `jobs` threads with a private cache each.
Frame compose_parallel(const PixelGrid& grid, int jobs);
