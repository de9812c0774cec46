#include <support/image_codec.hpp>
#include <support/exif.hpp>
#include <support/raster.hpp>
#include <drogon/drogon.h>

namespace imgrelay::image {

const char* toString(ImageFormat format) {
    switch (format) {
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Png: return "PNG";
        case ImageFormat::Webp: return "WEBP";
        case ImageFormat::Unknown: break;
    }
    return "unknown";
}

ImageFormat detectFormat(const std::string& data) {
    if (data.size() < 12) return ImageFormat::Unknown;
    const auto* buf = reinterpret_cast<const unsigned char*>(data.data());

    if (buf[0] == 0xFF && buf[1] == 0xD8 && buf[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    static const unsigned char pngSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (data.compare(0, 8, reinterpret_cast<const char*>(pngSignature), 8) == 0) {
        return ImageFormat::Png;
    }
    // RIFF container: "RIFF" <size> "WEBP"
    if (data.compare(0, 4, "RIFF") == 0 && data.compare(8, 4, "WEBP") == 0) {
        return ImageFormat::Webp;
    }
    return ImageFormat::Unknown;
}

static ImageFormat requireFormat(const std::string& data) {
    ImageFormat format = detectFormat(data);
    if (format == ImageFormat::Unknown) {
        throw CodecError("unsupported or unrecognized image format");
    }
    return format;
}

void NativeImageCodec::checkPixelBudget(const Dimensions& size) const {
    const uint64_t pixels = static_cast<uint64_t>(size.width) * static_cast<uint64_t>(size.height);
    if (size.width <= 0 || size.height <= 0 || pixels > maxPixels_) {
        throw CodecError("image of " + std::to_string(size.width) + "x" + std::to_string(size.height) +
                         " exceeds the decode limit of " + std::to_string(maxPixels_) + " pixels");
    }
}

ImageMetadata NativeImageCodec::decodeMetadata(const std::string& data) const {
    ImageMetadata metadata;
    metadata.format = requireFormat(data);

    switch (metadata.format) {
        case ImageFormat::Jpeg: {
            JpegInfo info = readJpegInfo(data);
            metadata.size = info.size;
            metadata.orientation = readExifOrientation(data);
            break;
        }
        case ImageFormat::Png: {
            PngInfo info = readPngInfo(data);
            metadata.size = info.size;
            metadata.hasAlpha = info.hasAlpha;
            break;
        }
        case ImageFormat::Webp: {
            WebpInfo info = readWebpInfo(data);
            metadata.size = info.size;
            metadata.hasAlpha = info.hasAlpha;
            break;
        }
        case ImageFormat::Unknown:
            break;
    }
    return metadata;
}

std::string NativeImageCodec::transformEncode(const std::string& data, const EncodeOptions& options) const {
    if (options.size.width <= 0 || options.size.height <= 0) {
        throw CodecError("invalid target size");
    }
    ImageFormat source = requireFormat(data);

    Raster raster;
    int jpegSubsampling = -1;
    switch (source) {
        case ImageFormat::Jpeg: {
            JpegInfo info = readJpegInfo(data);
            checkPixelBudget(info.size);
            jpegSubsampling = info.subsampling;
            raster = decodeJpeg(data, options.size);
            break;
        }
        case ImageFormat::Png:
            checkPixelBudget(readPngInfo(data).size);
            raster = decodePng(data);
            break;
        case ImageFormat::Webp:
            checkPixelBudget(readWebpInfo(data).size);
            raster = decodeWebp(data);
            break;
        case ImageFormat::Unknown:
            break;
    }

    if (raster.size() != options.size) {
        raster = resample(raster, options.size);
    }

    ImageFormat target = source;
    if (options.format == OutputFormat::Jpeg) target = ImageFormat::Jpeg;
    if (options.format == OutputFormat::Webp) target = ImageFormat::Webp;

    std::string encoded;
    switch (target) {
        case ImageFormat::Png:
            encoded = encodePng(raster);
            break;
        case ImageFormat::Webp:
            encoded = encodeWebp(raster, options.quality);
            break;
        default:
            encoded = encodeJpeg(raster, options.quality, jpegSubsampling);
            if (source == ImageFormat::Jpeg) {
                encoded = insertAppSegments(encoded, extractAppSegments(data));
            }
            break;
    }

    LOG_DEBUG << "Encoded " << toString(source) << " as " << toString(target) << " " << raster.width << "x" << raster.height
              << ": " << data.size() << " -> " << encoded.size() << " bytes";
    return encoded;
}

std::string NativeImageCodec::autoRotate(const std::string& data) const {
    ImageFormat format = requireFormat(data);
    if (format != ImageFormat::Jpeg) {
        return data;
    }

    int orientation = readExifOrientation(data);
    if (orientation <= 1) {
        return data;
    }
    checkPixelBudget(readJpegInfo(data).size);
    return resetExifOrientation(transformJpeg(data, orientation));
}

}
