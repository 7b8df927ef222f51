#include "StreamEncoder.hpp"
#include <optional>

std::string ansi256_fg(int color_index) {
    return "\033[38;5;" + std::to_string(color_index) + "m";
}

std::string ansi256_bg(int color_index) {
    return "\033[48;5;" + std::to_string(color_index) + "m";
}

std::string ansi_reset() {
    return "\033[0m";
}

std::string encode_line(const std::vector<StyledCell>& row, bool use_background) {
    std::string out;
    out.reserve(row.size() * 4);

    std::optional<int> last_color;
    for (const StyledCell& cell : row) {
        if (cell.color) {
            if (last_color != cell.color) {
                out += use_background ? ansi256_bg(*cell.color) : ansi256_fg(*cell.color);
                last_color = cell.color;
            }
        } else if (last_color) {
            out += ansi_reset();
            last_color.reset();
        }
        append_utf8(out, cell.glyph);
    }

    if (last_color) out += ansi_reset();
    return out;
}
