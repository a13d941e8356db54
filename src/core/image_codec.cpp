#include "image_codec.h"

#include <algorithm>
#include <cmath>

namespace imgopt::core {

ImageInfo cover_dimensions(const ImageInfo& source, int target_width) {
    ImageInfo result;
    if (source.width <= 0 || source.height <= 0 || target_width <= 0) {
        return result;
    }
    result.width = std::min(target_width, source.width);
    const double height = std::round(static_cast<double>(result.width) * source.height / source.width);
    result.height = std::max(1, static_cast<int>(height));
    return result;
}

} // namespace imgopt::core
