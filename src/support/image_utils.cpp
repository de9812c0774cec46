#include <support/image_utils.hpp>
#include <drogon/drogon.h>

namespace imgrelay::image {

std::optional<bool> detectTransparency(const ImageCodec& codec, const std::string& inputData) {
    try {
        return codec.decodeMetadata(inputData).hasAlpha;
    } catch (const std::exception& e) {
        LOG_DEBUG << "Transparency check could not read metadata: " << e.what();
        return std::nullopt;
    }
}

OrientationResult correctOrientation(const ImageCodec& codec, const std::string& inputData) {
    int orientation = 1;
    try {
        orientation = codec.decodeMetadata(inputData).orientation;
    } catch (const std::exception& e) {
        LOG_DEBUG << "Orientation check could not read metadata: " << e.what();
        return {inputData, false};
    }

    if (orientation <= 1) {
        return {inputData, false};
    }

    LOG_INFO << "EXIF orientation " << orientation << " detected, applying rotation";
    try {
        return {codec.autoRotate(inputData), true};
    } catch (const std::exception& e) {
        LOG_WARN << "EXIF rotation failed: " << e.what();
        return {inputData, false};
    }
}

}
