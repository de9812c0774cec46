#include <support/image_pipeline.hpp>
#include <support/image_utils.hpp>
#include <drogon/drogon.h>

namespace imgrelay::image {

namespace {

ProcessingResult failed(const std::string& safeData, const Dimensions& size, const std::string& message) {
    ProcessingResult result;
    result.processedData = safeData;
    result.newDimensions = size;
    result.processingError = message;
    return result;
}

// Quality for a re-encode that keeps the source format
int preservingQuality(ImageFormat format, const ProcessingSettings& settings) {
    return format == ImageFormat::Webp ? settings.webpQuality : settings.jpegQuality;
}

}

ProcessingResult processImage(const std::string& originalData, const ProcessingSettings& settings, const ImageCodec& codec) {
    const OutputFormat convertFormat = settings.convertToFormat;

    // JPEG has no alpha and WebP alpha does not survive resizing reliably, so
    // transparent sources are never converted.
    if (convertFormat != OutputFormat::None) {
        auto hasTransparency = detectTransparency(codec, originalData);
        if (hasTransparency.value_or(false)) {
            LOG_INFO << "Skipping " << toString(convertFormat) << " conversion - image has transparency";
            ProcessingResult result;
            result.processedData = originalData;
            try {
                result.newDimensions = codec.decodeMetadata(originalData).size;
            } catch (const std::exception& e) {
                LOG_DEBUG << "Size of transparent image unavailable: " << e.what();
            }
            return result;
        }
    }

    OrientationResult oriented = correctOrientation(codec, originalData);
    const std::string& workingData = oriented.data;

    ImageMetadata metadata;
    try {
        metadata = codec.decodeMetadata(workingData);
    } catch (const std::exception& e) {
        LOG_INFO << "Upload is not a decodable image, passing through: " << e.what();
        return failed(workingData, {}, e.what());
    }

    const Dimensions originalSize = metadata.size;
    const Dimensions targetSize = calculateResizeDimensions(originalSize, settings);
    const bool needsResize = targetSize != originalSize;

    if (convertFormat == OutputFormat::None) {
        ProcessingResult result;
        if (!needsResize) {
            LOG_DEBUG << "No processing needed for " << originalSize.width << "x" << originalSize.height << " image";
            result.processedData = workingData;
            result.newDimensions = originalSize;
            return result;
        }

        EncodeOptions options;
        options.size = targetSize;
        options.quality = preservingQuality(metadata.format, settings);
        options.format = OutputFormat::None;
        try {
            result.processedData = codec.transformEncode(workingData, options);
        } catch (const std::exception& e) {
            LOG_ERROR << "Resize failed, keeping original: " << e.what();
            return failed(workingData, originalSize, e.what());
        }

        LOG_INFO << "Resized " << toString(metadata.format) << " " << originalSize.width << "x" << originalSize.height
                 << " -> " << targetSize.width << "x" << targetSize.height;
        // Same format, so a smaller file does not count as compression
        result.wasResized = true;
        result.newDimensions = targetSize;
        return result;
    }

    EncodeOptions options;
    options.size = targetSize;
    options.quality = convertFormat == OutputFormat::Webp ? settings.webpQuality : settings.jpegQuality;
    options.format = convertFormat;

    std::string converted;
    try {
        converted = codec.transformEncode(workingData, options);
    } catch (const std::exception& e) {
        LOG_ERROR << "Conversion to " << toString(convertFormat) << " failed, keeping original: " << e.what();
        return failed(workingData, originalSize, e.what());
    }

    ProcessingResult result;
    result.wasResized = needsResize;
    // The point of converting is a smaller payload; an equal or larger result is discarded
    if (converted.size() < workingData.size()) {
        LOG_INFO << "Conversion to " << toString(convertFormat) << " successful: "
                 << workingData.size() << " -> " << converted.size() << " bytes";
        result.processedData = std::move(converted);
        result.wasCompressed = true;
        result.newDimensions = targetSize;
    } else {
        LOG_INFO << "Conversion to " << toString(convertFormat) << " skipped - would increase size: "
                 << workingData.size() << " -> " << converted.size() << " bytes";
        result.processedData = workingData;
        result.newDimensions = originalSize;
    }
    return result;
}

}
