#ifndef IMGRELAY_DIMENSIONS_HPP
#define IMGRELAY_DIMENSIONS_HPP

#include <support/config.hpp>
#include <ostream>

namespace imgrelay::image {
    struct Dimensions {
        int width = 0;
        int height = 0;

        bool operator==(const Dimensions& other) const {
            return width == other.width && height == other.height;
        }
        bool operator!=(const Dimensions& other) const { return !(*this == other); }
    };

    std::ostream& operator<<(std::ostream& os, const Dimensions& d);

    /**
     * @brief Target size for a resize. The narrow side strategy wins whenever
     *        settings.maxNarrowSide > 0, otherwise the bounding box applies.
     *        Never upscales.
     */
    Dimensions calculateResizeDimensions(const Dimensions& original, const ProcessingSettings& settings);

    // Scales so that min(width, height) == maxNarrowSide. The long edge is not limited.
    Dimensions calculateNarrowSideResize(const Dimensions& original, int maxNarrowSide);

    /**
     * @brief Fits the image into the box, with the larger limit applied to the image's
     *        long edge (width >= height counts as landscape).
     */
    Dimensions calculateBoundingBoxResize(const Dimensions& original, int maxWidth, int maxHeight);
}

#endif // IMGRELAY_DIMENSIONS_HPP
