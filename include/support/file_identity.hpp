#ifndef IMGRELAY_FILE_IDENTITY_HPP
#define IMGRELAY_FILE_IDENTITY_HPP

#include <support/config.hpp>
#include <support/image_pipeline.hpp>
#include <string>

namespace imgrelay {
    inline constexpr const char* kJpegMimeType = "image/jpeg";
    inline constexpr const char* kWebpMimeType = "image/webp";
    inline constexpr const char* kDefaultMimeType = "application/octet-stream";

    // Filename and Content-Type written for the uploaded file part
    struct FileIdentity {
        std::string filename;
        std::string mimeType;
    };

    /**
     * @brief Picks the filename and MIME type that match the bytes in the result.
     *
     * Anything not compressed keeps the original name and type (or the binary default
     * when none was declared). A compressed result carries the MIME type of the
     * conversion target and, with normalizeExtensions, the matching extension.
     */
    FileIdentity reconcileFileIdentity(const std::string& originalFilename,
                                       const std::string& originalMimeType,
                                       const image::ProcessingResult& result,
                                       const Config& config);

    // Replaces everything after the last dot of the final path component, or appends.
    std::string replaceExtension(const std::string& filename, const std::string& extension);
    std::string changeExtensionToJpg(const std::string& filename);
    std::string changeExtensionToWebp(const std::string& filename);
}

#endif // IMGRELAY_FILE_IDENTITY_HPP
