#pragma once

#include "image_format.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace imgopt::core {

constexpr const char* k_default_public_path = "/optimized";

// "a/b.jpg" -> "a/b-320w.webp". Without an extension the whole basename is the stem.
std::string output_filename(const std::string& original_path, int width, ImageFormat format);

// Path without the extension of its last component.
std::string strip_extension(const std::string& path);

// Lowercase extension without the dot, empty when there is none.
std::string extension_of(std::string_view path);

bool is_supported_image(std::string_view filename);

std::string collapse_slashes(std::string_view path);

struct OptimizeUrlOptions {
    std::string public_path = k_default_public_path;
    std::optional<int> width;
    std::optional<std::string> format;
    std::optional<int> quality;
};

// "/optimized/hero.jpg?w=640&format=webp"
std::string build_optimize_url(const std::string& image_path, const OptimizeUrlOptions& options);

// "/optimized/hero-640w.webp"
std::string build_variant_url(const std::string& base_name,
                              int width,
                              const std::string& format = "webp",
                              const std::string& public_path = k_default_public_path);

struct VariantName {
    std::string base;      // path before "-{width}w"
    int width = 0;
    std::string extension; // as written in the request, lowercased
    ImageFormat format = ImageFormat::WebP;
};

// Matches "name-{width}w.{webp|avif|jpeg|jpg|png}", case-insensitive, width > 0.
bool parse_variant_filename(const std::string& path, VariantName& out);

// Mime type by extension; "application/octet-stream" when unknown.
std::string content_type_for_path(std::string_view path);

// Percent-decoding; '+' becomes a space only in query components.
std::string url_decode(std::string_view value, bool plus_as_space = false);

struct RequestTarget {
    std::string path;
    std::string query;
};

RequestTarget split_request_target(std::string_view target);

// Later duplicates override earlier ones; keys and values are URL-decoded.
std::map<std::string, std::string> parse_query(std::string_view query);

// Relative, non-empty, no ".." or empty segments, no control characters.
bool is_safe_relative_path(std::string_view path);

// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
bool is_valid_utf8(std::string_view text);

} // namespace imgopt::core
