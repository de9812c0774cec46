#ifndef IMGRELAY_IMAGE_PIPELINE_HPP
#define IMGRELAY_IMAGE_PIPELINE_HPP

#include <support/config.hpp>
#include <support/dimensions.hpp>
#include <support/image_codec.hpp>
#include <optional>
#include <string>

namespace imgrelay::image {
    struct ProcessingResult {
        // Either the transformed bytes or the untransformed baseline, never a mix
        std::string processedData;
        // Format changed and the result is strictly smaller than the baseline
        bool wasCompressed = false;
        // The target size differed from the decoded size
        bool wasResized = false;
        // Size of the image in processedData (0x0 when the input is not an image)
        Dimensions newDimensions;
        // Set when the input is not a decodable image or the codec failed
        std::optional<std::string> processingError;
    };

    /**
     * @brief Decides how an upload is resized and converted and whether the result
     *        replaces the original bytes.
     *
     * Transparent images are never converted. The EXIF-corrected bytes are the baseline for
     * every size query and byte comparison. A conversion is kept only when strictly smaller
     * than the baseline. Never throws; failures leave safe bytes in processedData.
     *
     * @param originalData The raw bytes of the upload.
     * @param settings Resize and conversion settings.
     * @param codec Decode/encode backend.
     */
    ProcessingResult processImage(const std::string& originalData, const ProcessingSettings& settings, const ImageCodec& codec);
}

#endif // IMGRELAY_IMAGE_PIPELINE_HPP
