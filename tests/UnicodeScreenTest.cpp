#include "UnicodeScreen.hpp"
#include "StreamEncoder.hpp"
#include "lodepng.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <cstdlib>
#include <sstream>

namespace fs = std::filesystem;

class FakeDecoder : public ImageDecoder {
public:
    DecodeResult result;
    bool has_dimensions = false;
    int requested_width = -1;
    bool requested_dither = false;
    int probe_calls = 0;

    DecodeResult decode(const std::string& path, int target_pixel_width, bool dither) override {
        (void)path;
        requested_width = target_pixel_width;
        requested_dither = dither;
        return result;
    }

    bool probe_dimensions(const std::string&, int& width, int& height) override {
        probe_calls++;
        if (!has_dimensions) return false;
        width = 1024;
        height = 768;
        return true;
    }
};

static std::string glyph(uint8_t pattern) {
    std::string s;
    append_utf8(s, braille_glyph(pattern));
    return s;
}

static PixelGrid white_square() {
    PixelGrid grid;
    grid.set(0, 0, {255, 255, 255});
    grid.set(1, 0, {255, 255, 255});
    grid.set(0, 1, {255, 255, 255});
    grid.set(1, 1, {255, 255, 255});
    return grid;
}

TEST(UnicodeScreenTest, DisplaysFrame) {
    FakeDecoder decoder;
    decoder.result.pixels = white_square();
    decoder.has_dimensions = true;

    UnicodeScreen screen(decoder, 40, false, false, true);
    std::ostringstream out, err;
    screen.set_streams(out, err);

    ASSERT_TRUE(screen.display_image("/some/dir/pic.png"));
    EXPECT_EQ(decoder.requested_width, 80);
    EXPECT_TRUE(decoder.requested_dither);

    std::string expected =
        "Original dimensions: 1024x768\n"
        "Displaying image: pic.png (2x2) - Using Braille characters\n"
        "Character dimensions: 1x1\n"
        "=\n"
        "\033[38;5;231m" + glyph(27) + "\033[0m\n"
        "=\n";
    EXPECT_EQ(out.str(), expected);
    EXPECT_EQ(err.str(), "");
    EXPECT_EQ(decoder.probe_calls, 1);
}

TEST(UnicodeScreenTest, BackgroundModeLine) {
    FakeDecoder decoder;
    decoder.result.pixels = white_square();

    UnicodeScreen screen(decoder, 80, true, false, false);
    std::ostringstream out, err;
    screen.set_streams(out, err);

    ASSERT_TRUE(screen.display_image("pic.png"));
    EXPECT_NE(out.str().find("\033[48;5;231m" + glyph(27) + "\033[0m\n"), std::string::npos);
    EXPECT_EQ(out.str().find("Original dimensions"), std::string::npos);
}

TEST(UnicodeScreenTest, InvertAppliesBeforeQuantizing) {
    FakeDecoder decoder;
    decoder.result.pixels = white_square();

    UnicodeScreen screen(decoder, 80, false, true, false);
    std::ostringstream out, err;
    screen.set_streams(out, err);

    ASSERT_TRUE(screen.display_image("pic.png"));
    const Frame& frame = screen.get_frame();
    ASSERT_EQ(frame.char_height, 1);
    EXPECT_EQ(frame.rows[0][0].glyph, braille_glyph(0));
    EXPECT_EQ(frame.rows[0][0].color, std::optional<int>(16));
}

TEST(UnicodeScreenTest, RulerIsCappedAt80) {
    FakeDecoder decoder;
    decoder.result.pixels.set(199, 0, {10, 20, 30});

    UnicodeScreen screen(decoder, 100, false, false, false);
    std::ostringstream out, err;
    screen.set_streams(out, err);

    ASSERT_TRUE(screen.display_image("wide.png"));
    EXPECT_NE(out.str().find("Character dimensions: 100x1\n" + std::string(80, '=') + "\n"),
              std::string::npos);
    EXPECT_EQ(out.str().find(std::string(81, '=')), std::string::npos);
}

TEST(UnicodeScreenTest, ReportsMissingInput) {
    FakeDecoder decoder;
    decoder.result.status = DecodeStatus::NOT_FOUND;
    decoder.has_dimensions = true;

    UnicodeScreen screen(decoder, 80, false, false, false);
    std::ostringstream out, err;
    screen.set_streams(out, err);

    EXPECT_FALSE(screen.display_image("missing.png"));
    EXPECT_EQ(err.str(), "Error: File does not exist missing.png\n");
    EXPECT_EQ(out.str(), "");
    EXPECT_EQ(decoder.probe_calls, 0);
}

TEST(UnicodeScreenTest, ReportsDecodeFailure) {
    FakeDecoder decoder;
    decoder.result.status = DecodeStatus::DECODE_FAILED;
    decoder.has_dimensions = true;
    decoder.result.message = "convert: improper image header";

    UnicodeScreen screen(decoder, 80, false, false, false);
    std::ostringstream out, err;
    screen.set_streams(out, err);

    EXPECT_FALSE(screen.display_image("broken.png"));
    EXPECT_EQ(err.str(), "ImageMagick error: convert: improper image header\n");
    EXPECT_EQ(out.str(), "");
    EXPECT_EQ(screen.get_frame().char_height, 0);
    EXPECT_EQ(decoder.probe_calls, 0);
}

TEST(UnicodeScreenTest, ReportsEmptyResult) {
    FakeDecoder decoder;
    decoder.result.status = DecodeStatus::EMPTY_RESULT;

    UnicodeScreen screen(decoder, 80, false, false, false);
    std::ostringstream out, err;
    screen.set_streams(out, err);

    EXPECT_FALSE(screen.display_image("empty.png"));
    EXPECT_EQ(err.str(), "Error: Unable to parse pixel data\n");
    EXPECT_EQ(out.str(), "");
}

TEST(UnicodeScreenTest, ParallelJobsGiveSameOutput) {
    FakeDecoder decoder;
    for (int y = 0; y < 30; y++) {
        for (int x = 0; x < 20; x++) {
            decoder.result.pixels.set(x, y, {(uint8_t)(x * 12), (uint8_t)(y * 8), (uint8_t)((x + y) * 5)});
        }
    }

    std::ostringstream serial_out, parallel_out, err;

    UnicodeScreen serial(decoder, 10, false, false, false);
    serial.set_streams(serial_out, err);
    ASSERT_TRUE(serial.display_image("grad.png"));

    UnicodeScreen parallel(decoder, 10, false, false, false);
    parallel.set_jobs(4);
    parallel.set_streams(parallel_out, err);
    ASSERT_TRUE(parallel.display_image("grad.png"));

    EXPECT_EQ(serial_out.str(), parallel_out.str());
}

TEST(UnicodeScreenTest, ColorTest) {
    FakeDecoder decoder;
    UnicodeScreen screen(decoder, 80, false, false, false);
    std::ostringstream out, err;
    screen.set_streams(out, err);

    screen.print_color_test();
    std::string s = out.str();
    EXPECT_EQ(s.find("256-color Terminal Support Test\n"), 0u);
    EXPECT_NE(s.find("\033[48;5;0m   \033[0m"), std::string::npos);
    EXPECT_NE(s.find("R5G5: "), std::string::npos);
    EXPECT_NE(s.find("\033[48;5;255m  \033[0m"), std::string::npos);
    EXPECT_NE(s.find(glyph(31) + "\n"), std::string::npos);
    EXPECT_NE(s.find("\033[48;5;196m RGB(255,  0,  0) → 196 \033[0m"), std::string::npos);
}

static std::vector<unsigned char> decode_png(const std::string& path, unsigned& w, unsigned& h) {
    unsigned char* data = nullptr;
    unsigned error = lodepng_decode32_file(&data, &w, &h, path.c_str());
    std::vector<unsigned char> pixels;
    if (error == 0 && data) {
        pixels.assign(data, data + (size_t)w * h * 4);
    }
    free(data);
    return pixels;
}

TEST(UnicodeScreenTest, FramePngPreview) {
    Frame frame;
    frame.char_width = 1;
    frame.char_height = 1;
    StyledCell cell;
    cell.glyph = braille_glyph(27);
    cell.color = 196;
    frame.rows = {{cell}};

    std::string path = (fs::temp_directory_path() / "imgterm_preview_fg.png").string();
    ASSERT_TRUE(write_frame_png(frame, path, false, 1));

    unsigned w = 0, h = 0;
    std::vector<unsigned char> px = decode_png(path, w, h);
    ASSERT_EQ(w, 2u);
    ASSERT_EQ(h, 4u);
    ASSERT_EQ(px.size(), 32u);
    // (0,0) dot on
    EXPECT_EQ(px[0], 255);
    EXPECT_EQ(px[1], 0);
    EXPECT_EQ(px[2], 0);
    // (0,3) dot off
    size_t off = (3 * 2 + 0) * 4;
    EXPECT_EQ(px[off], 0);
    EXPECT_EQ(px[off + 1], 0);
    EXPECT_EQ(px[off + 2], 0);

    ASSERT_TRUE(write_frame_png(frame, path, true, 1));
    px = decode_png(path, w, h);
    ASSERT_EQ(px.size(), 32u);
    EXPECT_EQ(px[0], 229);
    EXPECT_EQ(px[off], 255);
    EXPECT_EQ(px[off + 1], 0);
    fs::remove(path);
}

TEST(UnicodeScreenTest, FramePngRejectsEmptyFrame) {
    Frame frame;
    std::string path = (fs::temp_directory_path() / "imgterm_preview_empty.png").string();
    EXPECT_FALSE(write_frame_png(frame, path, false));
}

TEST(UnicodeScreenTest, RenderPathWritesPreview) {
    FakeDecoder decoder;
    decoder.result.pixels = white_square();

    std::string path = (fs::temp_directory_path() / "imgterm_preview_render.png").string();
    fs::remove(path);

    UnicodeScreen screen(decoder, 80, false, false, false);
    screen.set_render_path(path);
    std::ostringstream out, err;
    screen.set_streams(out, err);

    ASSERT_TRUE(screen.display_image("pic.png"));
    EXPECT_TRUE(fs::exists(path));
    EXPECT_NE(out.str().find("Preview saved to " + path), std::string::npos);
    fs::remove(path);
}
