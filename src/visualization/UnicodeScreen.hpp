#pragma once
#include "ImageDecoder.hpp"
#include "FrameCompositor.hpp"
#include <iostream>
#include <string>

// Paints every Braille dot of the frame as a dot_size square and saves a PNG.
bool write_frame_png(const Frame& frame, const std::string& path, bool use_background, int dot_size = 4);

class UnicodeScreen {
public:
    UnicodeScreen(ImageDecoder& decoder, int width, bool use_bg, bool invert, bool dither);

    void set_jobs(int jobs);
    void set_render_path(const std::string& path);
    void set_streams(std::ostream& out, std::ostream& err);

    // Decode, compose and print one image. Returns false on any
    // input/decode error, in which case no frame is printed.
    bool display_image(const std::string& image_path);

    void print_color_test();

    const Frame& get_frame() const { return frame; }

private:
    ImageDecoder& decoder;
    int char_width;
    bool use_bg;
    bool invert;
    bool dither;
    int jobs = 1;
    std::string render_path;

    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;

    Frame frame;

    void print_frame(const std::string& name, const PixelGrid& pixels);
};
