#pragma once

#include <array>
#include <string>
#include <variant>

namespace imgopt::core {

enum class ImageFormat { WebP, Avif, Jpeg, Png };

constexpr std::array<ImageFormat, 4> k_all_image_formats = {
    ImageFormat::WebP,
    ImageFormat::Avif,
    ImageFormat::Jpeg,
    ImageFormat::Png,
};

constexpr int k_min_quality = 1;
constexpr int k_max_quality = 100;

struct WebpParams {
    int quality = 80;
};

struct AvifParams {
    int quality = 80;
};

struct JpegParams {
    int quality = 80;
    bool optimize_coding = true;
    bool progressive = true;
};

// PNG is lossless; quality is not used.
struct PngParams {
    int compression_level = 9;
};

using EncodeParams = std::variant<WebpParams, AvifParams, JpegParams, PngParams>;

// Visitor built from lambdas; std::visit rejects it at compile time when an
// alternative of EncodeParams has no matching overload.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Canonical lowercase name, also used as the file extension of variants.
const char* format_name(ImageFormat format);
const char* format_mime_type(ImageFormat format);

// Accepts "webp", "avif", "jpeg", "jpg" and "png" in any case.
bool parse_image_format(const std::string& value, ImageFormat& out, std::string& error);

int clamp_quality(int quality);

EncodeParams make_encode_params(ImageFormat format, int quality);
ImageFormat format_of(const EncodeParams& params);

} // namespace imgopt::core
