#include "Parameters.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <stdexcept>

void print_help(){
    std::cout << "imgterm - Display images in the terminal with Braille characters\n\n";
    std::cout << "Usage:\n";
    std::cout << "  imgterm <image> [options]\n";
    std::cout << "  imgterm --test              Test 256-color support\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --width <n>      Display width in characters (default 80)\n";
    std::cout << "  -b, --bg             Use background color mode (clearer but may flicker)\n";
    std::cout << "  -i, --invert         Invert colors\n";
    std::cout << "  -d, --dither         Use Floyd-Steinberg dithering for better color quality\n";
    std::cout << "  -t, --test           Test 256-color support\n";
    std::cout << "  -j, --jobs <n>       Worker threads used to compose the frame (default 1)\n";
    std::cout << "  -v, --verbose        Print the effective parameters before rendering\n";
    std::cout << "  --render <path>      Also save a PNG preview of the rendered frame\n";
    std::cout << "  --help               Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  imgterm image.jpg -w 100    Display with 100 character width\n";
    std::cout << "  imgterm image.png -b -i     Background color mode, invert colors\n";
    std::cout << "  imgterm image.gif -d        Use dithering for better quality\n";
}

bool Parameters::is_valid_number(const std::string& str, int min, int max) {
    if (str.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(str.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    return v >= min && v <= max;
}

Parameters::Parameters(int argc, char* argv[]) {
    arg_okay = true;
    for (int i = 1; i < argc; i++) {
        if (!strcmp(argv[i], "--help") || !strcmp(argv[i], "-h")) {
            show_help = true;
            return;
        }
    }

    for (int i = 1; i < argc; i++) {
        try {
            if (!strcmp(argv[i], "-w") || !strcmp(argv[i], "--width")) {
                if (i + 1 < argc) {
                    if (!is_valid_number(argv[i + 1], 1, INT_MAX / 2)) {
                        throw std::runtime_error("Error: --width must be a positive integer.");
                    }
                    width = std::atoi(argv[++i]);
                } else {
                    throw std::runtime_error("Error: Missing value for -w / --width.");
                }
            }
            else if (!strcmp(argv[i], "-j") || !strcmp(argv[i], "--jobs")) {
                if (i + 1 < argc) {
                    if (!is_valid_number(argv[i + 1], 1, 256)) {
                        throw std::runtime_error("Error: --jobs must be between 1 and 256.");
                    }
                    jobs = std::atoi(argv[++i]);
                } else {
                    throw std::runtime_error("Error: Missing value for -j / --jobs.");
                }
            }
            else if (!strcmp(argv[i], "-b") || !strcmp(argv[i], "--bg")) {
                use_bg = true;
            }
            else if (!strcmp(argv[i], "-i") || !strcmp(argv[i], "--invert")) {
                invert = true;
            }
            else if (!strcmp(argv[i], "-d") || !strcmp(argv[i], "--dither")) {
                dither = true;
            }
            else if (!strcmp(argv[i], "-v") || !strcmp(argv[i], "--verbose")) {
                verbose = true;
            }
            else if (!strcmp(argv[i], "-t") || !strcmp(argv[i], "--test")) {
                color_test = true;
            }
            else if (!strcmp(argv[i], "--render")) {
                if (i + 1 < argc) {
                    render_path = argv[++i];
                } else {
                    throw std::runtime_error("Error: Missing value for --render.");
                }
            }
            else if (argv[i][0] == '-' && argv[i][1] != '\0') {
                throw std::runtime_error("Error: Unknown parameter: " + std::string(argv[i]));
            }
            else if (image.empty()) {
                image = argv[i];
            }
            else {
                throw std::runtime_error("Error: Only one image can be displayed at a time.");
            }
        }
        catch (const std::exception& e) {
            std::cerr << "Wrong input parameters: " << e.what() << std::endl;
            std::cerr << "Error at argument: " << argv[i] << std::endl;
            arg_okay = false;
            return;
        }
    }

    if (image.empty() && !color_test) {
        show_help = true;
    }
    return;
}

void Parameters::print_args() {
    cout << "Input parameters >> " << endl;
    cout << "  image: " << image << endl;
    cout << "  width: " << width << endl;
    cout << "  bg: " << use_bg << endl;
    cout << "  invert: " << invert << endl;
    cout << "  dither: " << dither << endl;
    cout << "  jobs: " << jobs << endl;
    if (!render_path.empty()) {
        cout << "  render: " << render_path << endl;
    }
    cout << "\n";
    return;
}
