#include "UnicodeScreen.hpp"
#include "StreamEncoder.hpp"
#include "lodepng.h"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static const RGBA PNG_BACKGROUND = {0, 0, 0, 255};
static const RGBA PNG_DOT_ON_BG = {229, 229, 229, 255};

// --- PNG preview ---

bool write_frame_png(const Frame& frame, const std::string& path, bool use_background, int dot_size) {
    if (frame.char_width <= 0 || frame.char_height <= 0 || dot_size <= 0) return false;

    unsigned width = (unsigned)(frame.char_width * BLOCK_COLS * dot_size);
    unsigned height = (unsigned)(frame.char_height * BLOCK_ROWS * dot_size);
    std::vector<unsigned char> image((size_t)width * height * 4);

    auto fill = [&](unsigned x0, unsigned y0, const RGBA& c) {
        for (int dy = 0; dy < dot_size; dy++) {
            for (int dx = 0; dx < dot_size; dx++) {
                size_t i = ((size_t)(y0 + dy) * width + (x0 + dx)) * 4;
                image[i + 0] = c.r;
                image[i + 1] = c.g;
                image[i + 2] = c.b;
                image[i + 3] = c.a;
            }
        }
    };

    for (int cy = 0; cy < frame.char_height; cy++) {
        for (int cx = 0; cx < frame.char_width; cx++) {
            const StyledCell& cell = frame.rows[cy][cx];
            uint8_t pattern = cell.color ? (uint8_t)(cell.glyph - BRAILLE_BASE) : 0;
            RGBA color = cell.color ? Palettes::ID2RGBA[*cell.color] : PNG_BACKGROUND;

            for (int i = 0; i < BLOCK_SIZE; i++) {
                int px = i % BLOCK_COLS;
                int py = i / BLOCK_COLS;
                bool on = (pattern >> BRAILLE_BIT_FOR_SAMPLE[i]) & 1;

                RGBA c = PNG_BACKGROUND;
                if (use_background) {
                    if (cell.color) c = on ? PNG_DOT_ON_BG : color;
                } else if (on) {
                    c = color;
                }
                fill((unsigned)((cx * BLOCK_COLS + px) * dot_size),
                     (unsigned)((cy * BLOCK_ROWS + py) * dot_size), c);
            }
        }
    }

    unsigned error = lodepng_encode32_file(path.c_str(), image.data(), width, height);
    return error == 0;
}

// --- Constructor ---

UnicodeScreen::UnicodeScreen(ImageDecoder& decoder, int width, bool use_bg, bool invert, bool dither)
    : decoder(decoder), char_width(width), use_bg(use_bg), invert(invert), dither(dither) {}

void UnicodeScreen::set_jobs(int n) {
    jobs = std::max(1, n);
}

void UnicodeScreen::set_render_path(const std::string& path) {
    render_path = path;
}

void UnicodeScreen::set_streams(std::ostream& o, std::ostream& e) {
    out = &o;
    err = &e;
}

// --- Rendering ---

bool UnicodeScreen::display_image(const std::string& image_path) {
    frame = Frame();

    DecodeResult result = decoder.decode(image_path, char_width * BLOCK_COLS, dither);
    switch (result.status) {
        case DecodeStatus::OK:
            break;
        case DecodeStatus::NOT_FOUND:
            *err << "Error: File does not exist " << image_path << std::endl;
            return false;
        case DecodeStatus::DECODE_FAILED:
            *err << "ImageMagick error: " << result.message << std::endl;
            return false;
        case DecodeStatus::EMPTY_RESULT:
            *err << "Error: Unable to parse pixel data" << std::endl;
            return false;
    }
    if (result.pixels.empty()) {
        *err << "Error: Unable to parse pixel data" << std::endl;
        return false;
    }

    // Only a source the decoder accepted is probed.
    int orig_w = 0, orig_h = 0;
    if (decoder.probe_dimensions(image_path, orig_w, orig_h)) {
        *out << "Original dimensions: " << orig_w << "x" << orig_h << std::endl;
    }

    PixelGrid pixels = invert ? result.pixels.inverted() : std::move(result.pixels);

    if (jobs > 1) {
        frame = compose_parallel(pixels, jobs);
    } else {
        PaletteCache cache;
        frame = compose(pixels, cache);
    }

    print_frame(fs::path(image_path).filename().string(), pixels);

    if (!render_path.empty()) {
        if (!write_frame_png(frame, render_path, use_bg)) {
            *err << "Error: Failed to write preview to " << render_path << std::endl;
            return false;
        }
        *out << "Preview saved to " << render_path << std::endl;
    }
    return true;
}

void UnicodeScreen::print_frame(const std::string& name, const PixelGrid& pixels) {
    *out << "Displaying image: " << name << " (" << pixels.get_max_x() + 1 << "x"
         << pixels.get_max_y() + 1 << ") - Using Braille characters" << std::endl;
    *out << "Character dimensions: " << frame.char_width << "x" << frame.char_height << std::endl;

    std::string ruler(std::min(80, frame.char_width), '=');
    *out << ruler << "\n";
    for (const auto& row : frame.rows) {
        *out << encode_line(row, use_bg) << "\n";
    }
    *out << ruler << std::endl;
}

// --- Color self-test ---

void UnicodeScreen::print_color_test() {
    std::ostream& o = *out;
    o << "256-color Terminal Support Test\n";
    o << std::string(60, '=') << "\n";

    o << "\n1. System colors (0-15):\n";
    for (int i = 0; i < 16; i++) {
        o << ansi256_bg(i) << "   " << ansi_reset();
        if (i == 7 || i == 15) o << "\n";
    }

    o << "\n2. 216-color cube (16-231):\n";
    o << "R-axis → , G-axis ↓ , B-axis changes per line\n";
    for (int g = 0; g < 6; g++) {
        for (int r = 0; r < 6; r++) {
            o << "R" << r << "G" << g << ": ";
            for (int b = 0; b < 6; b++) {
                o << ansi256_bg(16 + 36 * r + 6 * g + b) << "  " << ansi_reset();
            }
            o << "\n";
        }
    }

    o << "\n3. Grayscale gradient (232-255):\n";
    for (int i = GRAY_RAMP_START; i < 256; i++) {
        o << ansi256_bg(i) << "  " << ansi_reset();
    }
    o << "\n";

    o << "\n4. Braille character test:\n";
    for (int i = 0; i < 32; i++) {
        std::string glyph;
        append_utf8(glyph, braille_glyph((uint8_t)i));
        o << glyph << (i % 16 != 15 ? " " : "\n");
    }

    o << "\n5. Color accuracy test:\n";
    static const RGB samples[] = {
        {255, 0, 0}, {0, 255, 0}, {0, 0, 255},
        {255, 255, 0}, {255, 0, 255}, {0, 255, 255},
    };
    for (const RGB& c : samples) {
        int idx = rgb_to_ansi256(c);
        char buf[64];
        snprintf(buf, sizeof(buf), " RGB(%3d,%3d,%3d) → %3d ", c.r, c.g, c.b, idx);
        o << ansi256_bg(idx) << buf << ansi_reset() << "\n";
    }
    o.flush();
}
