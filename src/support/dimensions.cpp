#include <support/dimensions.hpp>
#include <algorithm>
#include <cstdint>

namespace imgrelay::image {

std::ostream& operator<<(std::ostream& os, const Dimensions& d) {
    return os << d.width << "x" << d.height;
}

// Scales by numerator/denominator with truncation. Exact integer math so that the
// constrained side lands on the limit itself. A 1px floor keeps extreme strips encodable.
static Dimensions scaleDimensions(const Dimensions& original, int64_t numerator, int64_t denominator) {
    auto width = static_cast<int>(original.width * numerator / denominator);
    auto height = static_cast<int>(original.height * numerator / denominator);
    return {std::max(width, 1), std::max(height, 1)};
}

Dimensions calculateResizeDimensions(const Dimensions& original, const ProcessingSettings& settings) {
    if (settings.maxNarrowSide > 0) {
        return calculateNarrowSideResize(original, settings.maxNarrowSide);
    }
    return calculateBoundingBoxResize(original, settings.maxWidth, settings.maxHeight);
}

Dimensions calculateNarrowSideResize(const Dimensions& original, int maxNarrowSide) {
    int narrowSide = std::min(original.width, original.height);
    if (narrowSide <= maxNarrowSide) {
        return original;
    }
    return scaleDimensions(original, maxNarrowSide, narrowSide);
}

Dimensions calculateBoundingBoxResize(const Dimensions& original, int maxWidth, int maxHeight) {
    const int longLimit = std::max(maxWidth, maxHeight);
    const int shortLimit = std::min(maxWidth, maxHeight);

    const bool landscape = original.width >= original.height;
    const int effectiveWidth = landscape ? longLimit : shortLimit;
    const int effectiveHeight = landscape ? shortLimit : longLimit;

    if (original.width <= effectiveWidth && original.height <= effectiveHeight) {
        return original;
    }

    // min(effectiveWidth / width, effectiveHeight / height), compared by cross-multiplying
    if (static_cast<int64_t>(effectiveWidth) * original.height <= static_cast<int64_t>(effectiveHeight) * original.width) {
        return scaleDimensions(original, effectiveWidth, original.width);
    }
    return scaleDimensions(original, effectiveHeight, original.height);
}

}
