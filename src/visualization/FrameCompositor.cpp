#include "FrameCompositor.hpp"
#include <algorithm>
#include <system_error>
#include <thread>

int char_columns(int max_x) {
    return (int)(((long long)max_x + BLOCK_COLS) / BLOCK_COLS);
}

int char_rows(int max_y) {
    return (int)(((long long)max_y + BLOCK_ROWS) / BLOCK_ROWS);
}

Block gather_block(const PixelGrid& grid, int char_x, int char_y) {
    Block block;
    for (int py = 0; py < BLOCK_ROWS; py++) {
        for (int px = 0; px < BLOCK_COLS; px++) {
            RGB c;
            if (grid.get(char_x * BLOCK_COLS + px, char_y * BLOCK_ROWS + py, c)) {
                block[py * BLOCK_COLS + px] = c;
            }
        }
    }
    return block;
}

StyledCell compose_cell(const PixelGrid& grid, int char_x, int char_y, PaletteCache& cache) {
    Block block = gather_block(grid, char_x, char_y);

    int count = 0;
    int total_r = 0, total_g = 0, total_b = 0;
    for (const auto& sample : block) {
        if (!sample) continue;
        total_r += sample->r;
        total_g += sample->g;
        total_b += sample->b;
        count++;
    }

    StyledCell cell;
    if (count == 0) return cell;

    // Truncating mean
    RGB avg = {(uint8_t)(total_r / count), (uint8_t)(total_g / count), (uint8_t)(total_b / count)};
    cell.color = cache.lookup(avg);
    cell.glyph = braille_glyph(quantize(block));
    return cell;
}

void compose_stripe(const PixelGrid& grid, Frame& frame, int stripe, int stripes, PaletteCache& cache) {
    for (int cy = stripe; cy < frame.char_height; cy += stripes) {
        std::vector<StyledCell>& row = frame.rows[cy];
        row.resize(frame.char_width);
        for (int cx = 0; cx < frame.char_width; cx++) {
            row[cx] = compose_cell(grid, cx, cy, cache);
        }
    }
}

static Frame empty_frame(const PixelGrid& grid) {
    Frame frame;
    if (grid.empty()) return frame;
    frame.char_width = char_columns(grid.get_max_x());
    frame.char_height = char_rows(grid.get_max_y());
    frame.rows.resize(frame.char_height);
    return frame;
}

Frame compose(const PixelGrid& grid, PaletteCache& cache) {
    Frame frame = empty_frame(grid);
    compose_stripe(grid, frame, 0, 1, cache);
    return frame;
}

Frame compose_parallel(const PixelGrid& grid, int jobs) {
    Frame frame = empty_frame(grid);
    int workers = std::min(jobs, frame.char_height);
    if (workers <= 1) {
        PaletteCache cache;
        compose_stripe(grid, frame, 0, 1, cache);
        return frame;
    }

    // Interleaved rows; every worker only writes its own row slots.
    std::vector<std::thread> threads;
    threads.reserve(workers);
    int started = 0;
    try {
        for (; started < workers; started++) {
            threads.emplace_back([&grid, &frame, started, workers]() {
                PaletteCache cache;
                compose_stripe(grid, frame, started, workers, cache);
            });
        }
    } catch (const std::system_error&) {
        // Stripes without a thread are composed below on this one.
    }

    PaletteCache cache;
    for (int w = started; w < workers; w++) {
        compose_stripe(grid, frame, w, workers, cache);
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    return frame;
}
