#ifndef IMGRELAY_RASTER_HPP
#define IMGRELAY_RASTER_HPP

#include <support/dimensions.hpp>
#include <string>
#include <vector>

// Pixel level building blocks of NativeImageCodec.
namespace imgrelay::image {
    // 8-bit interleaved pixels, rows packed without padding.
    struct Raster {
        int width = 0;
        int height = 0;
        int channels = 3; // 3: RGB, 4: RGBA

        std::vector<unsigned char> pixels;

        Raster() = default;
        Raster(int w, int h, int c) : width(w), height(h), channels(c), pixels(static_cast<size_t>(w) * h * c) {}

        Dimensions size() const { return {width, height}; }
    };

    // OpenCV INTER_AREA resampling. Intended for downscaling; equal size returns a copy.
    Raster resample(const Raster& source, const Dimensions& target);

    // TurboJPEG
    struct JpegInfo {
        Dimensions size;
        int subsampling = -1;
    };
    JpegInfo readJpegInfo(const std::string& data);
    // Uses the smallest DCT scaling factor whose output still covers minimumSize.
    Raster decodeJpeg(const std::string& data, const Dimensions& minimumSize);
    // subsampling < 0 selects 4:2:0
    std::string encodeJpeg(const Raster& raster, int quality, int subsampling = -1);
    // Lossless transform for EXIF orientation 2..8. Markers are copied unchanged.
    std::string transformJpeg(const std::string& data, int exifOrientation);

    // libpng simplified API
    struct PngInfo {
        Dimensions size;
        bool hasAlpha = false;
    };
    PngInfo readPngInfo(const std::string& data);
    Raster decodePng(const std::string& data);
    std::string encodePng(const Raster& raster);

    // libwebp
    struct WebpInfo {
        Dimensions size;
        bool hasAlpha = false;
    };
    WebpInfo readWebpInfo(const std::string& data);
    Raster decodeWebp(const std::string& data);
    std::string encodeWebp(const Raster& raster, int quality);
}

#endif // IMGRELAY_RASTER_HPP
