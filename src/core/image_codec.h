#pragma once

#include "image_format.h"

#include <filesystem>
#include <string>
#include <vector>

namespace imgopt::core {

struct ImageInfo {
    int width = 0;
    int height = 0;
};

// Cover-resize target: the source is scaled to cover width x height and
// center-cropped to exactly that size.
struct TransformRequest {
    int width = 0;
    int height = 0;
    EncodeParams params;
};

struct EncodedImage {
    std::vector<unsigned char> bytes;
    int width = 0;
    int height = 0;
    ImageFormat format = ImageFormat::WebP;
};

// Resize + encode capability. Implementations must be safe to call from
// several threads at once.
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    // Lowercase extension without the dot. Originals the codec cannot decode
    // are left out of batch runs.
    virtual bool can_decode(const std::string& extension) const = 0;

    virtual bool probe(const std::filesystem::path& path, ImageInfo& out, std::string& error) = 0;

    virtual bool transform(const std::filesystem::path& path,
                           const TransformRequest& request,
                           EncodedImage& out,
                           std::string& error) = 0;
};

// Height for a cover-resize to target_width that keeps the source aspect,
// never wider than the source.
ImageInfo cover_dimensions(const ImageInfo& source, int target_width);

} // namespace imgopt::core
