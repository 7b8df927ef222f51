#include "ImageDecoder.hpp"
#include "PixelParser.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <vector>
#include <unistd.h>
#include <sys/wait.h>

namespace fs = std::filesystem;

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

// Runs cmd through the shell, collecting stdout. Returns the exit status,
// or -1 when the process could not be started.
static int run_capture(const std::string& cmd, std::string& output) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return -1;

    char buf[8192];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) output.append(buf, n);

    int status = pclose(pipe);
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

MagickDecoder::MagickDecoder(const std::string& convert_cmd, const std::string& identify_cmd)
    : convert_cmd(convert_cmd), identify_cmd(identify_cmd) {}

std::string MagickDecoder::build_convert_command(const std::string& path, int target_pixel_width, bool dither) const {
    std::string cmd = convert_cmd + " " + shell_quote(path);
    if (dither) {
        cmd += " -dither FloydSteinberg";
    }
    cmd += " -resize " + std::to_string(target_pixel_width) + "x";
    cmd += " -unsharp 0.5x0.5+0.5+0.008";
    cmd += " -colorspace RGB";
    cmd += " txt:-";
    return cmd;
}

DecodeResult MagickDecoder::decode(const std::string& path, int target_pixel_width, bool dither) {
    DecodeResult result;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        result.status = DecodeStatus::NOT_FOUND;
        result.message = "File does not exist " + path;
        return result;
    }

    fs::path tmp_dir = fs::temp_directory_path(ec);
    std::string err_template = (tmp_dir / "imgterm_stderr_XXXXXX").string();
    std::vector<char> err_buf(err_template.begin(), err_template.end());
    err_buf.push_back('\0');
    int fd = ec ? -1 : mkstemp(err_buf.data());
    if (fd == -1) {
        result.status = DecodeStatus::DECODE_FAILED;
        result.message = "could not create temporary file for diagnostics";
        return result;
    }
    close(fd);
    std::string err_path(err_buf.data());

    std::string output;
    std::string cmd = build_convert_command(path, target_pixel_width, dither) +
                      " 2>" + shell_quote(err_path);
    int ret = run_capture(cmd, output);
    std::string diagnostic = read_file(err_path);
    std::remove(err_path.c_str());

    if (ret != 0) {
        result.status = DecodeStatus::DECODE_FAILED;
        result.message = diagnostic.empty()
            ? convert_cmd + " exited with status " + std::to_string(ret)
            : diagnostic;
        return result;
    }

    result.pixels = parse_pixel_text(output);
    if (result.pixels.empty()) {
        result.status = DecodeStatus::EMPTY_RESULT;
        result.message = "Unable to parse pixel data";
    }
    return result;
}

bool MagickDecoder::probe_dimensions(const std::string& path, int& width, int& height) {
    std::string output;
    std::string cmd = identify_cmd + " -format \"%w %h\" " + shell_quote(path) + " 2>/dev/null";
    if (run_capture(cmd, output) != 0) return false;

    int w = 0, h = 0;
    if (sscanf(output.c_str(), "%d %d", &w, &h) != 2 || w <= 0 || h <= 0) return false;
    width = w;
    height = h;
    return true;
}
