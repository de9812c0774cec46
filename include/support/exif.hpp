#ifndef IMGRELAY_EXIF_HPP
#define IMGRELAY_EXIF_HPP

#include <string>
#include <vector>

namespace imgrelay::image {
    /**
     * @brief Collects the APP1..APP15 segments (EXIF, XMP, ICC, ...) found before the scan data.
     * @param jpegData The raw bytes of a JPEG image.
     * @return Each segment including its marker and length bytes. Empty for non-JPEG input.
     */
    std::vector<std::string> extractAppSegments(const std::string& jpegData);

    /**
     * @brief Inserts segments right after the SOI marker of a JPEG.
     * @param jpegData A freshly encoded JPEG.
     * @param segments Segments as returned by extractAppSegments.
     */
    std::string insertAppSegments(const std::string& jpegData, const std::vector<std::string>& segments);

    /**
     * @brief Reads tag 0x0112 from IFD0 of the APP1 Exif segment.
     * @return The orientation (1..8), or 1 when there is no readable tag.
     */
    int readExifOrientation(const std::string& jpegData);

    // Rewrites the orientation tag to 1 in place. Data without the tag is returned as is.
    std::string resetExifOrientation(std::string jpegData);
}

#endif // IMGRELAY_EXIF_HPP
