#include "BrailleQuantizer.hpp"

const std::array<int, BLOCK_SIZE> BRAILLE_BIT_FOR_SAMPLE = {0, 3, 1, 4, 2, 5, 6, 7};

double brightness(const RGB& c) {
    return 0.2126 * c.r + 0.7152 * c.g + 0.0722 * c.b;
}

uint8_t quantize(const Block& block) {
    uint8_t pattern = 0;
    for (int i = 0; i < BLOCK_SIZE; i++) {
        if (!block[i]) continue;
        if (brightness(*block[i]) > BRIGHTNESS_THRESHOLD) {
            pattern |= (uint8_t)(1u << BRAILLE_BIT_FOR_SAMPLE[i]);
        }
    }
    return pattern;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += (char)cp;
    } else if (cp < 0x800) {
        out += (char)(0xC0 | ((cp >> 6) & 0x1F));
        out += (char)(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += (char)(0xE0 | ((cp >> 12) & 0x0F));
        out += (char)(0x80 | ((cp >> 6) & 0x3F));
        out += (char)(0x80 | (cp & 0x3F));
    } else {
        out += (char)(0xF0 | ((cp >> 18) & 0x07));
        out += (char)(0x80 | ((cp >> 12) & 0x3F));
        out += (char)(0x80 | ((cp >> 6) & 0x3F));
        out += (char)(0x80 | (cp & 0x3F));
    }
}
