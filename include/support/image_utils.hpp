#ifndef IMGRELAY_IMAGE_UTILS_HPP
#define IMGRELAY_IMAGE_UTILS_HPP

#include <support/image_codec.hpp>
#include <optional>
#include <string>

namespace imgrelay::image {
    struct OrientationResult {
        std::string data;
        bool rotated = false;
    };

    /**
     * @brief Checks the codec metadata for an alpha channel.
     * @param codec The codec used to read the metadata.
     * @param inputData The raw bytes of the upload.
     * @return The alpha flag, or std::nullopt when the metadata could not be read.
     */
    std::optional<bool> detectTransparency(const ImageCodec& codec, const std::string& inputData);

    /**
     * @brief Applies a non-identity EXIF orientation to the pixels. Best effort: any failure
     *        yields the input bytes unchanged.
     * @param codec The codec used for the metadata query and the rotation.
     * @param inputData The raw bytes of the upload.
     * @return The bytes every later size query and size comparison must use.
     */
    OrientationResult correctOrientation(const ImageCodec& codec, const std::string& inputData);
}

#endif // IMGRELAY_IMAGE_UTILS_HPP
