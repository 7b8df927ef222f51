#include <iostream>
#include "Parameters.hpp"
#include "ImageDecoder.hpp"
#include "UnicodeScreen.hpp"

int main(int argc, char* argv[]) {
    Parameters params(argc, argv);

    if (!params.check_arg_okay()) {
        return -1;
    }
    if (params.get_show_help()) {
        print_help();
        return 0;
    }

    MagickDecoder decoder;
    UnicodeScreen screen(decoder, params.get_width(), params.get_bg(),
                         params.get_invert(), params.get_dither());

    if (params.get_color_test()) {
        screen.print_color_test();
        return 0;
    }

    if (params.get_verbose()) {
        params.print_args();
    }

    screen.set_jobs(params.get_jobs());
    if (!params.get_render_path().empty()) {
        screen.set_render_path(params.get_render_path());
    }

    if (!screen.display_image(params.get_image())) {
        return -1;
    }
    return 0;
}
