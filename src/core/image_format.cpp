#include "image_format.h"

#include <algorithm>
#include <cctype>

namespace imgopt::core {

const char* format_name(ImageFormat format) {
    switch (format) {
        case ImageFormat::WebP:
            return "webp";
        case ImageFormat::Avif:
            return "avif";
        case ImageFormat::Jpeg:
            return "jpeg";
        case ImageFormat::Png:
            return "png";
    }
    return "webp";
}

const char* format_mime_type(ImageFormat format) {
    switch (format) {
        case ImageFormat::WebP:
            return "image/webp";
        case ImageFormat::Avif:
            return "image/avif";
        case ImageFormat::Jpeg:
            return "image/jpeg";
        case ImageFormat::Png:
            return "image/png";
    }
    return "application/octet-stream";
}

bool parse_image_format(const std::string& value, ImageFormat& out, std::string& error) {
    std::string lower = value;
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "webp") {
        out = ImageFormat::WebP;
        return true;
    }
    if (lower == "avif") {
        out = ImageFormat::Avif;
        return true;
    }
    if (lower == "jpeg" || lower == "jpg") {
        out = ImageFormat::Jpeg;
        return true;
    }
    if (lower == "png") {
        out = ImageFormat::Png;
        return true;
    }
    error = "invalid format '" + value + "'";
    return false;
}

int clamp_quality(int quality) {
    return std::clamp(quality, k_min_quality, k_max_quality);
}

EncodeParams make_encode_params(ImageFormat format, int quality) {
    const int q = clamp_quality(quality);
    switch (format) {
        case ImageFormat::WebP:
            return WebpParams{q};
        case ImageFormat::Avif:
            return AvifParams{q};
        case ImageFormat::Jpeg:
            return JpegParams{q, true, true};
        case ImageFormat::Png:
            return PngParams{9};
    }
    return WebpParams{q};
}

ImageFormat format_of(const EncodeParams& params) {
    return std::visit(Overloaded{
                          [](const WebpParams&) { return ImageFormat::WebP; },
                          [](const AvifParams&) { return ImageFormat::Avif; },
                          [](const JpegParams&) { return ImageFormat::Jpeg; },
                          [](const PngParams&) { return ImageFormat::Png; },
                      },
                      params);
}

} // namespace imgopt::core
