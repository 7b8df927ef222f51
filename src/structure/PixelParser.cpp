#include "PixelParser.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

static std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace((unsigned char)s[start])) start++;
    while (end > start && std::isspace((unsigned char)s[end - 1])) end--;
    return s.substr(start, end - start);
}

static bool parse_long(const std::string& field, long& out) {
    std::string s = trim(field);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

static bool parse_double(const std::string& field, double& out) {
    std::string s = trim(field);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string item;
    std::istringstream in(s);
    while (std::getline(in, item, sep)) parts.push_back(item);
    if (!s.empty() && s.back() == sep) parts.push_back("");
    return parts;
}

uint8_t percent_to_channel(double pct) {
    long v = std::lround(pct * 255.0 / 100.0);
    return (uint8_t)std::clamp(v, 0L, 255L);
}

static bool parse_channel(const std::string& field, bool percent, uint8_t& out) {
    if (percent) {
        std::string s = trim(field);
        if (!s.empty() && s.back() == '%') s.pop_back();
        double pct;
        if (!parse_double(s, pct)) return false;
        out = percent_to_channel(pct);
        return true;
    }
    long v;
    if (!parse_long(field, v)) return false;
    out = (uint8_t)std::clamp(v, 0L, 255L);
    return true;
}

bool parse_pixel_line(const std::string& raw, int& x, int& y, RGB& color) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return false;

    size_t colon = line.find(':');
    if (colon == std::string::npos) return false;

    std::vector<std::string> coords = split(line.substr(0, colon), ',');
    if (coords.size() != 2) return false;
    long lx, ly;
    if (!parse_long(coords[0], lx) || !parse_long(coords[1], ly)) return false;
    if (lx < 0 || ly < 0 || lx > MAX_PIXEL_COORDINATE || ly > MAX_PIXEL_COORDINATE) return false;

    size_t open = line.find('(', colon + 1);
    if (open == std::string::npos) return false;
    size_t close = line.find(')', open);
    if (close == std::string::npos) return false;

    std::vector<std::string> parts = split(line.substr(open + 1, close - open - 1), ',');
    if (parts.size() < 3) return false;

    bool percent = parts[0].find('%') != std::string::npos;
    RGB c;
    if (!parse_channel(parts[0], percent, c.r) ||
        !parse_channel(parts[1], percent, c.g) ||
        !parse_channel(parts[2], percent, c.b)) {
        return false;
    }

    x = (int)lx;
    y = (int)ly;
    color = c;
    return true;
}

PixelGrid parse_pixel_text(const std::string& text) {
    PixelGrid grid;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        int x, y;
        RGB c;
        if (parse_pixel_line(line, x, y, c)) {
            grid.set(x, y, c);
        }
    }
    return grid;
}
