#pragma once

#include "image_codec.h"

namespace imgopt::core {

// Decodes JPEG, PNG and GIF with stb_image and WebP with libwebp; resizes with
// stb_image_resize2; encodes PNG with stb_image_write, JPEG with libjpeg and
// WebP with libwebp. AVIF is read and written with libavif when the build
// found it (IMGOPT_HAVE_AVIF). TIFF and SVG originals are not decodable.
class StbImageCodec : public ImageCodec {
public:
    bool can_decode(const std::string& extension) const override;

    bool probe(const std::filesystem::path& path, ImageInfo& out, std::string& error) override;

    bool transform(const std::filesystem::path& path,
                   const TransformRequest& request,
                   EncodedImage& out,
                   std::string& error) override;
};

} // namespace imgopt::core
