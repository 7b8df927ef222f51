#pragma once
#include "PixelGrid.hpp"
#include <string>

enum class DecodeStatus {
    OK,
    NOT_FOUND,      // source path is not accessible
    DECODE_FAILED,  // external tool failed, message holds its diagnostic
    EMPTY_RESULT,   // tool succeeded but produced no usable samples
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::OK;
    PixelGrid pixels;
    std::string message;

    bool ok() const { return status == DecodeStatus::OK; }
};

class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;

    virtual DecodeResult decode(const std::string& path, int target_pixel_width, bool dither) = 0;

    // Source dimensions before resizing, if the backend can tell.
    virtual bool probe_dimensions(const std::string&, int&, int&) {
        return false;
    }
};

// Decodes through ImageMagick's convert/identify, reading "txt:-" output.
class MagickDecoder : public ImageDecoder {
public:
    MagickDecoder(const std::string& convert_cmd = "convert",
                  const std::string& identify_cmd = "identify");

    DecodeResult decode(const std::string& path, int target_pixel_width, bool dither) override;
    bool probe_dimensions(const std::string& path, int& width, int& height) override;

    std::string build_convert_command(const std::string& path, int target_pixel_width, bool dither) const;

private:
    std::string convert_cmd;
    std::string identify_cmd;
};

std::string shell_quote(const std::string& arg);
