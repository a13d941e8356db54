#include "on_the_fly.h"

#include "cli_parse.h"
#include "file_utils.h"
#include "image_codec.h"
#include "pipeline.h"

#include <array>
#include <map>

namespace fs = std::filesystem;

namespace imgopt::core {

namespace {

// Extensions tried, in order, when looking for the original of a variant.
constexpr std::array<const char*, 5> k_source_extensions = {"jpg", "jpeg", "png", "webp", "avif"};

Response text_response(int status, const std::string& message, ErrorKind kind) {
    Response response;
    response.status = status;
    response.content_type = "text/plain";
    response.body.assign(message.begin(), message.end());
    response.error_kind = kind;
    return response;
}

Response file_response(const fs::path& path,
                       const std::string& cache_control,
                       Delivery delivery,
                       const char* optimized_value) {
    Response response;
    std::string error;
    if (!read_file_bytes(path, response.body, error)) {
        return text_response(404, "Not found", ErrorKind::NotFound);
    }
    response.status = 200;
    response.content_type = content_type_for_path(path.generic_string());
    response.headers.emplace_back("Cache-Control", cache_control);
    if (optimized_value != nullptr) {
        response.headers.emplace_back(k_optimized_header, optimized_value);
    }
    response.delivery = delivery;
    return response;
}

Response encoded_response(EncodedImage&& encoded, const std::string& cache_control) {
    Response response;
    response.status = 200;
    response.content_type = format_mime_type(encoded.format);
    response.body = std::move(encoded.bytes);
    response.headers.emplace_back("Cache-Control", cache_control);
    response.headers.emplace_back(k_optimized_header, "on-the-fly");
    response.delivery = Delivery::Generated;
    return response;
}

bool is_cancelled(const CancellationToken* cancel) {
    return cancel != nullptr && cancel->cancelled();
}

std::optional<std::string> query_value(const std::map<std::string, std::string>& params, const std::string& key) {
    const auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

const std::string* Response::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

OnTheFlyResolver::OnTheFlyResolver(Pipeline& pipeline) : pipeline_(pipeline) {}

Response OnTheFlyResolver::handle(const std::string& request_target, const CancellationToken* cancel) {
    const RequestTarget target = split_request_target(request_target);
    const std::string path = collapse_slashes(target.path);

    std::string prefix = collapse_slashes(pipeline_.config().public_path);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    if (path.size() <= prefix.size() + 1 || path.compare(0, prefix.size(), prefix) != 0 ||
        path[prefix.size()] != '/') {
        return text_response(404, "Not found", ErrorKind::NotFound);
    }

    const std::string relative_path = url_decode(std::string_view(path).substr(prefix.size() + 1));
    if (!is_safe_relative_path(relative_path) || !is_supported_image(relative_path)) {
        return text_response(404, "Not found", ErrorKind::NotFound);
    }

    VariantName variant;
    if (parse_variant_filename(relative_path, variant)) {
        return serve_variant_request(relative_path, variant, cancel);
    }
    return serve_query_request(relative_path, target.query, cancel);
}

Response OnTheFlyResolver::serve_variant_request(const std::string& relative_path,
                                                 const VariantName& variant,
                                                 const CancellationToken* cancel) {
    const fs::path output_path = pipeline_.output_root() / relative_path;
    if (file_exists(output_path)) {
        return file_response(output_path, k_immutable_cache_control, Delivery::PreProcessed, "pre-processed");
    }

    std::string original;
    for (const char* ext : k_source_extensions) {
        if (!pipeline_.codec().can_decode(ext)) {
            continue;
        }
        const std::string candidate = variant.base + "." + ext;
        if (file_exists(pipeline_.input_root() / candidate)) {
            original = candidate;
            break;
        }
    }
    if (original.empty()) {
        return text_response(404, "Source image not found", ErrorKind::NotFound);
    }

    auto lock = pipeline_.path_locks().lock(original);
    // a concurrent request may have written it while we waited
    if (file_exists(output_path)) {
        return file_response(output_path, k_immutable_cache_control, Delivery::PreProcessed, "pre-processed");
    }

    const fs::path input_path = pipeline_.input_root() / original;
    ImageCodec& codec = pipeline_.codec();
    ImageInfo source;
    std::string error;
    if (!codec.probe(input_path, source, error)) {
        pipeline_.log().error("On-the-fly optimization failed for " + original + ": " + error);
        return text_response(500, "Failed to process image", ErrorKind::TransformFailed);
    }

    const ImageInfo target = cover_dimensions(source, variant.width);
    TransformRequest request;
    request.width = target.width;
    request.height = target.height;
    request.params = make_encode_params(variant.format, pipeline_.config().quality);

    if (is_cancelled(cancel)) {
        return text_response(k_status_client_closed, "Request cancelled", ErrorKind::None);
    }
    EncodedImage encoded;
    if (!codec.transform(input_path, request, encoded, error)) {
        pipeline_.log().error("On-the-fly optimization failed for " + original + ": " + error);
        return text_response(500, "Failed to process image", ErrorKind::TransformFailed);
    }
    if (is_cancelled(cancel)) {
        return text_response(k_status_client_closed, "Request cancelled", ErrorKind::None);
    }

    if (!write_file_atomic(output_path, encoded.bytes, error)) {
        pipeline_.log().error("failed to cache " + relative_path + ": " + error);
    } else {
        pipeline_.log().detail("Cached on-the-fly variant: " + relative_path);
    }
    return encoded_response(std::move(encoded), k_immutable_cache_control);
}

Response OnTheFlyResolver::serve_query_request(const std::string& relative_path,
                                               const std::string& query,
                                               const CancellationToken* cancel) {
    const std::map<std::string, std::string> params = parse_query(query);
    const std::optional<std::string> width_param = query_value(params, "w");
    const std::optional<std::string> format_param = query_value(params, "format");
    const std::optional<std::string> quality_param = query_value(params, "q");
    const OptimizerConfig& config = pipeline_.config();

    if (!width_param && !format_param && !quality_param) {
        const fs::path output_path = pipeline_.output_root() / relative_path;
        if (file_exists(output_path)) {
            return file_response(output_path, k_immutable_cache_control, Delivery::PreProcessed, "pre-processed");
        }
        const fs::path input_path = pipeline_.input_root() / relative_path;
        if (file_exists(input_path)) {
            return file_response(input_path, k_short_cache_control, Delivery::Original, nullptr);
        }
        return text_response(404, "Not found", ErrorKind::NotFound);
    }

    int width = 0;
    if (width_param && !parse_positive_int(*width_param, width)) {
        return text_response(400, "Invalid width", ErrorKind::None);
    }
    ImageFormat format = config.formats.empty() ? ImageFormat::WebP : config.formats.front();
    std::string error;
    if (format_param && !parse_image_format(*format_param, format, error)) {
        return text_response(400, "Unsupported format", ErrorKind::None);
    }
    int quality = config.quality;
    if (quality_param && !parse_int(*quality_param, quality)) {
        return text_response(400, "Invalid quality", ErrorKind::None);
    }

    const fs::path input_path = pipeline_.input_root() / relative_path;
    if (!file_exists(input_path)) {
        return text_response(404, "Not found", ErrorKind::NotFound);
    }

    ImageCodec& codec = pipeline_.codec();
    ImageInfo source;
    if (!codec.probe(input_path, source, error)) {
        pipeline_.log().error("On-the-fly optimization failed for " + relative_path + ": " + error);
        return text_response(500, "Failed to process image", ErrorKind::TransformFailed);
    }

    const ImageInfo target = cover_dimensions(source, width_param ? width : source.width);
    TransformRequest request;
    request.width = target.width;
    request.height = target.height;
    request.params = make_encode_params(format, quality);

    if (is_cancelled(cancel)) {
        return text_response(k_status_client_closed, "Request cancelled", ErrorKind::None);
    }
    EncodedImage encoded;
    if (!codec.transform(input_path, request, encoded, error)) {
        pipeline_.log().error("On-the-fly optimization failed for " + relative_path + ": " + error);
        return text_response(500, "Failed to process image", ErrorKind::TransformFailed);
    }
    if (is_cancelled(cancel)) {
        return text_response(k_status_client_closed, "Request cancelled", ErrorKind::None);
    }
    return encoded_response(std::move(encoded), k_short_cache_control);
}

const char* delivery_name(Delivery delivery) {
    switch (delivery) {
        case Delivery::None:
            return "none";
        case Delivery::PreProcessed:
            return "pre-processed";
        case Delivery::Generated:
            return "on-the-fly";
        case Delivery::Original:
            return "original";
    }
    return "none";
}

const char* status_text(int status) {
    switch (status) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case k_status_client_closed:
            return "Client Closed Request";
        case 500:
            return "Internal Server Error";
        default:
            return "Unknown";
    }
}

} // namespace imgopt::core
