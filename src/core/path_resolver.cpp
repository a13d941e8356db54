#include "path_resolver.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace imgopt::core {

namespace {

constexpr std::array<std::string_view, 8> k_supported_extensions = {
    "jpg", "jpeg", "png", "gif", "webp", "avif", "tiff", "svg",
};

std::string to_lower_copy(std::string_view value) {
    std::string lower(value);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// Position of the extension dot in the last path component, npos when absent.
size_t extension_dot(std::string_view path) {
    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot == std::string_view::npos) {
        return std::string_view::npos;
    }
    if (slash != std::string_view::npos && dot < slash) {
        return std::string_view::npos;
    }
    const size_t name_start = slash == std::string_view::npos ? 0 : slash + 1;
    if (dot == name_start) {
        // ".hidden" has no extension
        return std::string_view::npos;
    }
    return dot;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

std::string strip_extension(const std::string& path) {
    const size_t dot = extension_dot(path);
    if (dot == std::string::npos) {
        return path;
    }
    return path.substr(0, dot);
}

std::string extension_of(std::string_view path) {
    const size_t dot = extension_dot(path);
    if (dot == std::string_view::npos) {
        return {};
    }
    return to_lower_copy(path.substr(dot + 1));
}

std::string output_filename(const std::string& original_path, int width, ImageFormat format) {
    return strip_extension(original_path) + "-" + std::to_string(width) + "w." + format_name(format);
}

bool is_supported_image(std::string_view filename) {
    const std::string ext = extension_of(filename);
    if (ext.empty()) {
        return false;
    }
    return std::ranges::find(k_supported_extensions, ext) != k_supported_extensions.end();
}

std::string collapse_slashes(std::string_view path) {
    std::string result;
    result.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !result.empty() && result.back() == '/') {
            continue;
        }
        result.push_back(c);
    }
    return result;
}

std::string build_optimize_url(const std::string& image_path, const OptimizeUrlOptions& options) {
    std::string url = collapse_slashes(options.public_path + "/" + image_path);
    std::string query;
    auto append = [&query](const std::string& key, const std::string& value) {
        query += query.empty() ? "?" : "&";
        query += key + "=" + value;
    };
    if (options.width) {
        append("w", std::to_string(*options.width));
    }
    if (options.format) {
        append("format", *options.format);
    }
    if (options.quality) {
        append("q", std::to_string(*options.quality));
    }
    return url + query;
}

std::string build_variant_url(const std::string& base_name,
                              int width,
                              const std::string& format,
                              const std::string& public_path) {
    return collapse_slashes(public_path + "/" + base_name + "-" + std::to_string(width) + "w." + format);
}

bool parse_variant_filename(const std::string& path, VariantName& out) {
    const size_t dot = extension_dot(path);
    if (dot == std::string::npos) {
        return false;
    }
    const std::string ext = to_lower_copy(std::string_view(path).substr(dot + 1));
    ImageFormat format = ImageFormat::WebP;
    std::string error;
    if (!parse_image_format(ext, format, error)) {
        return false;
    }

    // "{base}-{digits}w" must precede the dot
    if (dot < 4) {
        return false;
    }
    const char w = path[dot - 1];
    if (w != 'w' && w != 'W') {
        return false;
    }
    size_t digits_begin = dot - 1;
    while (digits_begin > 0 && std::isdigit(static_cast<unsigned char>(path[digits_begin - 1])) != 0) {
        --digits_begin;
    }
    if (digits_begin == dot - 1 || digits_begin < 2 || path[digits_begin - 1] != '-') {
        return false;
    }

    int width = 0;
    const char* first = path.data() + digits_begin;
    const char* last = path.data() + dot - 1;
    const auto [ptr, ec] = std::from_chars(first, last, width);
    if (ec != std::errc() || ptr != last || width <= 0) {
        return false;
    }

    out.base = path.substr(0, digits_begin - 1);
    out.width = width;
    out.extension = ext;
    out.format = format;
    return true;
}

std::string content_type_for_path(std::string_view path) {
    const std::string ext = extension_of(path);
    if (ext == "jpg" || ext == "jpeg") {
        return "image/jpeg";
    }
    if (ext == "png" || ext == "gif" || ext == "webp" || ext == "avif" || ext == "tiff") {
        return "image/" + ext;
    }
    if (ext == "svg") {
        return "image/svg+xml";
    }
    return "application/octet-stream";
}

std::string url_decode(std::string_view value, bool plus_as_space) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '%' && i + 2 < value.size()) {
            const int hi = hex_value(value[i + 1]);
            const int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        result.push_back(plus_as_space && c == '+' ? ' ' : c);
    }
    return result;
}

RequestTarget split_request_target(std::string_view target) {
    RequestTarget result;
    const size_t fragment = target.find('#');
    if (fragment != std::string_view::npos) {
        target = target.substr(0, fragment);
    }
    const size_t question = target.find('?');
    if (question == std::string_view::npos) {
        result.path = std::string(target);
        return result;
    }
    result.path = std::string(target.substr(0, question));
    result.query = std::string(target.substr(question + 1));
    return result;
}

std::map<std::string, std::string> parse_query(std::string_view query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string_view::npos) {
            amp = query.size();
        }
        const std::string_view pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            const size_t equals = pair.find('=');
            if (equals == std::string_view::npos) {
                params[url_decode(pair, true)] = std::string();
            } else {
                params[url_decode(pair.substr(0, equals), true)] = url_decode(pair.substr(equals + 1), true);
            }
        }
        pos = amp + 1;
    }
    return params;
}

bool is_safe_relative_path(std::string_view path) {
    if (path.empty() || path.front() == '/' || path.find('\\') != std::string_view::npos) {
        return false;
    }
    const bool has_control = std::ranges::any_of(path, [](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte < 0x20 || byte == 0x7f;
    });
    if (has_control) {
        return false;
    }
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }
        const std::string_view segment = path.substr(pos, slash - pos);
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        pos = slash + 1;
    }
    return true;
}

bool is_valid_utf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        unsigned int code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        }
        if ((lead & 0xe0) == 0xc0) {
            length = 2;
            code_point = lead & 0x1f;
        } else if ((lead & 0xf0) == 0xe0) {
            length = 3;
            code_point = lead & 0x0f;
        } else if ((lead & 0xf8) == 0xf0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + length > text.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xc0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3f);
        }
        constexpr unsigned int k_min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < k_min_for_length[length] || code_point > 0x10ffff ||
            (code_point >= 0xd800 && code_point <= 0xdfff)) {
            return false;
        }
        i += length;
    }
    return true;
}

} // namespace imgopt::core
