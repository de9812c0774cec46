#include <support/raster.hpp>
#include <support/image_codec.hpp>
#include <webp/decode.h>
#include <webp/encode.h>
#include <cstring>

namespace imgrelay::image {

static const uint8_t* bytes(const std::string& data) {
    return reinterpret_cast<const uint8_t*>(data.data());
}

static WebPBitstreamFeatures readFeatures(const std::string& data) {
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(bytes(data), data.size(), &features) != VP8_STATUS_OK) {
        throw CodecError("libwebp could not read bitstream features");
    }
    if (features.has_animation) {
        throw CodecError("animated WebP is not supported");
    }
    return features;
}

WebpInfo readWebpInfo(const std::string& data) {
    WebPBitstreamFeatures features = readFeatures(data);
    return {{features.width, features.height}, features.has_alpha != 0};
}

Raster decodeWebp(const std::string& data) {
    WebPBitstreamFeatures features = readFeatures(data);
    const int channels = features.has_alpha ? 4 : 3;

    int width = 0;
    int height = 0;
    uint8_t* decoded = channels == 4
        ? WebPDecodeRGBA(bytes(data), data.size(), &width, &height)
        : WebPDecodeRGB(bytes(data), data.size(), &width, &height);
    if (!decoded) throw CodecError("libwebp decode failed");

    Raster raster(width, height, channels);
    std::memcpy(raster.pixels.data(), decoded, raster.pixels.size());
    WebPFree(decoded);
    return raster;
}

std::string encodeWebp(const Raster& raster, int quality) {
    uint8_t* output = nullptr;
    const auto factor = static_cast<float>(quality);
    size_t size = raster.channels == 4
        ? WebPEncodeRGBA(raster.pixels.data(), raster.width, raster.height, raster.width * 4, factor, &output)
        : WebPEncodeRGB(raster.pixels.data(), raster.width, raster.height, raster.width * 3, factor, &output);
    if (size == 0) {
        if (output) WebPFree(output);
        throw CodecError("libwebp encode failed");
    }

    std::string result(reinterpret_cast<char*>(output), size);
    WebPFree(output);
    return result;
}

}
