#include <support/raster.hpp>
#include <support/image_codec.hpp>
#include <png.h>

namespace imgrelay::image {

static void beginRead(png_image& image, const std::string& data) {
    image = png_image{};
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_memory(&image, data.data(), data.size())) {
        throw CodecError(std::string("libpng read failed: ") + image.message);
    }
}

PngInfo readPngInfo(const std::string& data) {
    png_image image;
    beginRead(image, data);

    PngInfo info;
    info.size = {static_cast<int>(image.width), static_cast<int>(image.height)};
    // Set for an alpha channel and for a tRNS chunk alike
    info.hasAlpha = (image.format & PNG_FORMAT_FLAG_ALPHA) != 0;
    png_image_free(&image);
    return info;
}

Raster decodePng(const std::string& data) {
    png_image image;
    beginRead(image, data);

    const bool hasAlpha = (image.format & PNG_FORMAT_FLAG_ALPHA) != 0;
    image.format = hasAlpha ? PNG_FORMAT_RGBA : PNG_FORMAT_RGB;

    Raster raster(static_cast<int>(image.width), static_cast<int>(image.height), hasAlpha ? 4 : 3);
    if (!png_image_finish_read(&image, nullptr, raster.pixels.data(), 0, nullptr)) {
        std::string message = image.message;
        png_image_free(&image);
        throw CodecError("libpng decode failed: " + message);
    }
    return raster;
}

std::string encodePng(const Raster& raster) {
    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    image.width = static_cast<png_uint_32>(raster.width);
    image.height = static_cast<png_uint_32>(raster.height);
    image.format = raster.channels == 4 ? PNG_FORMAT_RGBA : PNG_FORMAT_RGB;

    // First pass only measures
    png_alloc_size_t size = 0;
    if (!png_image_write_to_memory(&image, nullptr, &size, 0, raster.pixels.data(), 0, nullptr)) {
        throw CodecError(std::string("libpng encode failed: ") + image.message);
    }

    std::string result(size, '\0');
    if (!png_image_write_to_memory(&image, result.data(), &size, 0, raster.pixels.data(), 0, nullptr)) {
        throw CodecError(std::string("libpng encode failed: ") + image.message);
    }
    result.resize(size);
    return result;
}

}
