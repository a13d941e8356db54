#pragma once

#include "errors.h"
#include "path_resolver.h"

#include <atomic>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace imgopt::core {

class Pipeline;

constexpr const char* k_optimized_header = "X-Image-Optimized";
constexpr const char* k_immutable_cache_control = "public, max-age=31536000, immutable";
constexpr const char* k_short_cache_control = "public, max-age=86400";
constexpr int k_status_client_closed = 499;

enum class Delivery {
    None,
    PreProcessed, // variant already on disk
    Generated,    // encoded for this request
    Original,     // untouched source file
};

struct Response {
    int status = 404;
    std::string content_type = "text/plain";
    std::vector<unsigned char> body;
    std::vector<std::pair<std::string, std::string>> headers;
    Delivery delivery = Delivery::None;
    ErrorKind error_kind = ErrorKind::None;

    const std::string* header(const std::string& name) const;
};

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Serves GET {public_path}/{image} requests from the output tree, the input
// tree, or by generating the variant on demand.
class OnTheFlyResolver {
public:
    explicit OnTheFlyResolver(Pipeline& pipeline);

    Response handle(const std::string& request_target, const CancellationToken* cancel = nullptr);

private:
    Response serve_variant_request(const std::string& relative_path,
                                   const VariantName& variant,
                                   const CancellationToken* cancel);
    Response serve_query_request(const std::string& relative_path,
                                 const std::string& query,
                                 const CancellationToken* cancel);

    Pipeline& pipeline_;
};

const char* delivery_name(Delivery delivery);
const char* status_text(int status);

} // namespace imgopt::core
