#include "stb_image_codec.h"

#include "file_utils.h"
#include "path_resolver.h"

#include <algorithm>
#include <cmath>
#include <csetjmp>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize2.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <jpeglib.h>
#include <webp/decode.h>
#include <webp/encode.h>

#ifdef IMGOPT_HAVE_AVIF
#include <avif/avif.h>
#endif

namespace imgopt::core {

namespace {

constexpr int NUM_CHANNELS = 4;

struct StbiDeleter {
    void operator()(unsigned char* data) const { stbi_image_free(data); }
};
using StbiPixels = std::unique_ptr<unsigned char, StbiDeleter>;

// RGBA pixels of exactly width x height.
struct Bitmap {
    std::vector<unsigned char> pixels;
    int width = 0;
    int height = 0;
};

bool load_stb_bitmap(const std::filesystem::path& path, Bitmap& out, std::string& error) {
    int w = 0;
    int h = 0;
    int channels = 0;
    StbiPixels data(stbi_load(path.string().c_str(), &w, &h, &channels, NUM_CHANNELS));
    if (!data) {
        const char* reason = stbi_failure_reason();
        error = "failed to decode '" + path.string() + "': " + (reason != nullptr ? reason : "unknown error");
        return false;
    }
    const size_t size = static_cast<size_t>(w) * static_cast<size_t>(h) * NUM_CHANNELS;
    out.pixels.assign(data.get(), data.get() + size);
    out.width = w;
    out.height = h;
    return true;
}

bool load_webp_bitmap(const std::filesystem::path& path, Bitmap& out, std::string& error) {
    std::vector<unsigned char> bytes;
    if (!read_file_bytes(path, bytes, error)) {
        return false;
    }
    int w = 0;
    int h = 0;
    uint8_t* data = WebPDecodeRGBA(bytes.data(), bytes.size(), &w, &h);
    if (data == nullptr) {
        error = "failed to decode '" + path.string() + "': invalid WebP data";
        return false;
    }
    const size_t size = static_cast<size_t>(w) * static_cast<size_t>(h) * NUM_CHANNELS;
    out.pixels.assign(data, data + size);
    out.width = w;
    out.height = h;
    WebPFree(data);
    return true;
}

bool probe_webp(const std::filesystem::path& path, ImageInfo& out, std::string& error) {
    std::vector<unsigned char> bytes;
    if (!read_file_bytes(path, bytes, error)) {
        return false;
    }
    int w = 0;
    int h = 0;
    if (!WebPGetInfo(bytes.data(), bytes.size(), &w, &h)) {
        error = "failed to read '" + path.string() + "': invalid WebP header";
        return false;
    }
    out.width = w;
    out.height = h;
    return true;
}

#ifdef IMGOPT_HAVE_AVIF

struct AvifDecoderDeleter {
    void operator()(avifDecoder* decoder) const { avifDecoderDestroy(decoder); }
};
struct AvifEncoderDeleter {
    void operator()(avifEncoder* encoder) const { avifEncoderDestroy(encoder); }
};
struct AvifImageDeleter {
    void operator()(avifImage* image) const { avifImageDestroy(image); }
};

bool open_avif(const std::filesystem::path& path,
               std::unique_ptr<avifDecoder, AvifDecoderDeleter>& decoder,
               std::string& error) {
    decoder.reset(avifDecoderCreate());
    if (!decoder) {
        error = "failed to create AVIF decoder";
        return false;
    }
    avifResult result = avifDecoderSetIOFile(decoder.get(), path.string().c_str());
    if (result == AVIF_RESULT_OK) {
        result = avifDecoderParse(decoder.get());
    }
    if (result != AVIF_RESULT_OK) {
        error = "failed to read '" + path.string() + "': " + avifResultToString(result);
        return false;
    }
    return true;
}

bool probe_avif(const std::filesystem::path& path, ImageInfo& out, std::string& error) {
    std::unique_ptr<avifDecoder, AvifDecoderDeleter> decoder;
    if (!open_avif(path, decoder, error)) {
        return false;
    }
    out.width = static_cast<int>(decoder->image->width);
    out.height = static_cast<int>(decoder->image->height);
    return true;
}

bool load_avif_bitmap(const std::filesystem::path& path, Bitmap& out, std::string& error) {
    std::unique_ptr<avifDecoder, AvifDecoderDeleter> decoder;
    if (!open_avif(path, decoder, error)) {
        return false;
    }
    avifResult result = avifDecoderNextImage(decoder.get());
    if (result != AVIF_RESULT_OK) {
        error = "failed to decode '" + path.string() + "': " + avifResultToString(result);
        return false;
    }
    avifImage* image = decoder->image;
    out.width = static_cast<int>(image->width);
    out.height = static_cast<int>(image->height);
    out.pixels.resize(static_cast<size_t>(out.width) * out.height * NUM_CHANNELS);

    avifRGBImage rgb;
    avifRGBImageSetDefaults(&rgb, image);
    rgb.format = AVIF_RGB_FORMAT_RGBA;
    rgb.depth = 8;
    rgb.pixels = out.pixels.data();
    rgb.rowBytes = static_cast<uint32_t>(out.width * NUM_CHANNELS);
    result = avifImageYUVToRGB(image, &rgb);
    if (result != AVIF_RESULT_OK) {
        error = "failed to convert '" + path.string() + "' to RGB: " + avifResultToString(result);
        return false;
    }
    return true;
}

#endif

bool load_bitmap(const std::filesystem::path& path, Bitmap& out, std::string& error) {
    const std::string extension = extension_of(path.generic_string());
    if (extension == "webp") {
        return load_webp_bitmap(path, out, error);
    }
#ifdef IMGOPT_HAVE_AVIF
    if (extension == "avif") {
        return load_avif_bitmap(path, out, error);
    }
#endif
    return load_stb_bitmap(path, out, error);
}

// Scales to cover the target box, then crops the overflow evenly from both sides.
bool cover_resize(const Bitmap& source, int width, int height, Bitmap& out, std::string& error) {
    if (width <= 0 || height <= 0) {
        error = "invalid target size " + std::to_string(width) + "x" + std::to_string(height);
        return false;
    }
    const double scale = std::max(static_cast<double>(width) / source.width,
                                  static_cast<double>(height) / source.height);
    const int scaled_w = std::max(width, static_cast<int>(std::ceil(source.width * scale)));
    const int scaled_h = std::max(height, static_cast<int>(std::ceil(source.height * scale)));

    std::vector<unsigned char> scaled(static_cast<size_t>(scaled_w) * scaled_h * NUM_CHANNELS);
    if (stbir_resize_uint8_linear(source.pixels.data(), source.width, source.height, 0,
                                  scaled.data(), scaled_w, scaled_h, 0, STBIR_RGBA) == nullptr) {
        error = "failed to resize image";
        return false;
    }

    const int offset_x = (scaled_w - width) / 2;
    const int offset_y = (scaled_h - height) / 2;
    const size_t row_bytes = static_cast<size_t>(width) * NUM_CHANNELS;
    out.pixels.resize(row_bytes * height);
    for (int y = 0; y < height; ++y) {
        const unsigned char* src =
            scaled.data() + (static_cast<size_t>(offset_y + y) * scaled_w + offset_x) * NUM_CHANNELS;
        std::copy_n(src, row_bytes, out.pixels.data() + static_cast<size_t>(y) * row_bytes);
    }
    out.width = width;
    out.height = height;
    return true;
}

std::mutex png_level_mutex;

bool encode_png(const Bitmap& bitmap, const PngParams& params, std::vector<unsigned char>& out, std::string& error) {
    auto write_callback = [](void* context, void* data, int size) {
        auto* bytes = static_cast<std::vector<unsigned char>*>(context);
        auto* begin = static_cast<unsigned char*>(data);
        bytes->insert(bytes->end(), begin, begin + size);
    };
    // the compression level is a process-wide stb setting
    std::scoped_lock lock(png_level_mutex);
    stbi_write_png_compression_level = params.compression_level;
    if (stbi_write_png_to_func(write_callback, &out, bitmap.width, bitmap.height, NUM_CHANNELS,
                               bitmap.pixels.data(), bitmap.width * NUM_CHANNELS) == 0) {
        error = "failed to encode PNG";
        return false;
    }
    return true;
}

struct JpegErrorManager {
    jpeg_error_mgr base;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* manager = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, manager->message);
    std::longjmp(manager->jump, 1);
}

bool encode_jpeg(const Bitmap& bitmap, const JpegParams& params, std::vector<unsigned char>& out, std::string& error) {
    // libjpeg has no alpha channel
    std::vector<unsigned char> rgb(static_cast<size_t>(bitmap.width) * bitmap.height * 3);
    for (size_t i = 0, j = 0; i < bitmap.pixels.size(); i += NUM_CHANNELS, j += 3) {
        rgb[j + 0] = bitmap.pixels[i + 0];
        rgb[j + 1] = bitmap.pixels[i + 1];
        rgb[j + 2] = bitmap.pixels[i + 2];
    }

    jpeg_compress_struct cinfo{};
    JpegErrorManager manager{};
    unsigned char* buffer = nullptr;
    unsigned long size = 0;
    cinfo.err = jpeg_std_error(&manager.base);
    manager.base.error_exit = jpeg_error_exit;
    if (setjmp(manager.jump) != 0) {
        jpeg_destroy_compress(&cinfo);
        std::free(buffer);
        error = std::string("failed to encode JPEG: ") + manager.message;
        return false;
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &buffer, &size);
    cinfo.image_width = static_cast<JDIMENSION>(bitmap.width);
    cinfo.image_height = static_cast<JDIMENSION>(bitmap.height);
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, params.quality, TRUE);
    cinfo.optimize_coding = params.optimize_coding ? TRUE : FALSE;
    if (params.progressive) {
        jpeg_simple_progression(&cinfo);
    }

    jpeg_start_compress(&cinfo, TRUE);
    const size_t stride = static_cast<size_t>(bitmap.width) * 3;
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = rgb.data() + static_cast<size_t>(cinfo.next_scanline) * stride;
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    out.assign(buffer, buffer + size);
    std::free(buffer);
    return true;
}

bool encode_webp(const Bitmap& bitmap, const WebpParams& params, std::vector<unsigned char>& out, std::string& error) {
    uint8_t* output = nullptr;
    const size_t size = WebPEncodeRGBA(bitmap.pixels.data(), bitmap.width, bitmap.height,
                                       bitmap.width * NUM_CHANNELS, static_cast<float>(params.quality), &output);
    if (size == 0 || output == nullptr) {
        WebPFree(output);
        error = "failed to encode WebP";
        return false;
    }
    out.assign(output, output + size);
    WebPFree(output);
    return true;
}

#ifdef IMGOPT_HAVE_AVIF

bool encode_avif(const Bitmap& bitmap, const AvifParams& params, std::vector<unsigned char>& out, std::string& error) {
    std::unique_ptr<avifImage, AvifImageDeleter> image(
        avifImageCreate(static_cast<uint32_t>(bitmap.width), static_cast<uint32_t>(bitmap.height), 8,
                        AVIF_PIXEL_FORMAT_YUV420));
    if (!image) {
        error = "failed to allocate AVIF image";
        return false;
    }
    avifRGBImage rgb;
    avifRGBImageSetDefaults(&rgb, image.get());
    rgb.format = AVIF_RGB_FORMAT_RGBA;
    rgb.depth = 8;
    // read only during the conversion
    rgb.pixels = const_cast<uint8_t*>(bitmap.pixels.data());
    rgb.rowBytes = static_cast<uint32_t>(bitmap.width * NUM_CHANNELS);
    avifResult result = avifImageRGBToYUV(image.get(), &rgb);
    if (result != AVIF_RESULT_OK) {
        error = std::string("failed to encode AVIF: ") + avifResultToString(result);
        return false;
    }

    std::unique_ptr<avifEncoder, AvifEncoderDeleter> encoder(avifEncoderCreate());
    if (!encoder) {
        error = "failed to create AVIF encoder";
        return false;
    }
    encoder->quality = params.quality;
    encoder->qualityAlpha = params.quality;
    encoder->speed = AVIF_SPEED_DEFAULT;

    avifRWData output = AVIF_DATA_EMPTY;
    result = avifEncoderWrite(encoder.get(), image.get(), &output);
    if (result != AVIF_RESULT_OK) {
        avifRWDataFree(&output);
        error = std::string("failed to encode AVIF: ") + avifResultToString(result);
        return false;
    }
    out.assign(output.data, output.data + output.size);
    avifRWDataFree(&output);
    return true;
}

#else

bool encode_avif(const Bitmap&, const AvifParams&, std::vector<unsigned char>&, std::string& error) {
    error = "AVIF encoding is not available: built without libavif";
    return false;
}

#endif

} // namespace

bool StbImageCodec::can_decode(const std::string& extension) const {
    if (extension == "jpg" || extension == "jpeg" || extension == "png" || extension == "gif" ||
        extension == "webp") {
        return true;
    }
#ifdef IMGOPT_HAVE_AVIF
    return extension == "avif";
#else
    return false;
#endif
}

bool StbImageCodec::probe(const std::filesystem::path& path, ImageInfo& out, std::string& error) {
    const std::string extension = extension_of(path.generic_string());
    if (extension == "webp") {
        return probe_webp(path, out, error);
    }
#ifdef IMGOPT_HAVE_AVIF
    if (extension == "avif") {
        return probe_avif(path, out, error);
    }
#endif
    int w = 0;
    int h = 0;
    int channels = 0;
    if (!stbi_info(path.string().c_str(), &w, &h, &channels)) {
        const char* reason = stbi_failure_reason();
        error = "failed to read '" + path.string() + "': " + (reason != nullptr ? reason : "unknown error");
        return false;
    }
    out.width = w;
    out.height = h;
    return true;
}

bool StbImageCodec::transform(const std::filesystem::path& path,
                              const TransformRequest& request,
                              EncodedImage& out,
                              std::string& error) {
    const ImageFormat format = format_of(request.params);
    Bitmap source;
    if (!load_bitmap(path, source, error)) {
        return false;
    }
    Bitmap target;
    if (!cover_resize(source, request.width, request.height, target, error)) {
        return false;
    }

    std::vector<unsigned char> bytes;
    const bool encoded = std::visit(
        Overloaded{
            [&](const WebpParams& params) { return encode_webp(target, params, bytes, error); },
            [&](const AvifParams& params) { return encode_avif(target, params, bytes, error); },
            [&](const JpegParams& params) { return encode_jpeg(target, params, bytes, error); },
            [&](const PngParams& params) { return encode_png(target, params, bytes, error); },
        },
        request.params);
    if (!encoded) {
        return false;
    }

    out.bytes = std::move(bytes);
    out.width = target.width;
    out.height = target.height;
    out.format = format;
    return true;
}

} // namespace imgopt::core
