#include <support/file_identity.hpp>
#include <drogon/drogon.h>

namespace imgrelay {

std::string replaceExtension(const std::string& filename, const std::string& extension) {
    auto lastSlash = filename.find_last_of("/\\");
    auto nameStart = lastSlash == std::string::npos ? 0 : lastSlash + 1;
    auto lastDot = filename.find_last_of('.');
    if (lastDot == std::string::npos || lastDot < nameStart) {
        return filename + extension;
    }
    return filename.substr(0, lastDot) + extension;
}

std::string changeExtensionToJpg(const std::string& filename) {
    return replaceExtension(filename, ".JPG");
}

std::string changeExtensionToWebp(const std::string& filename) {
    return replaceExtension(filename, ".WEBP");
}

static FileIdentity keepOriginal(const std::string& filename, const std::string& mimeType) {
    return {filename, mimeType.empty() ? kDefaultMimeType : mimeType};
}

FileIdentity reconcileFileIdentity(const std::string& originalFilename,
                                   const std::string& originalMimeType,
                                   const image::ProcessingResult& result,
                                   const Config& config) {
    if (result.processingError) {
        LOG_INFO << "Non-image file or processing failed, keeping original: " << originalFilename;
        return keepOriginal(originalFilename, originalMimeType);
    }

    if (!result.wasCompressed) {
        if (config.processing.convertToFormat == OutputFormat::None) {
            LOG_DEBUG << "Format conversion disabled, keeping original name: " << originalFilename;
        } else {
            LOG_DEBUG << "Original kept (better compression), keeping original name: " << originalFilename;
        }
        return keepOriginal(originalFilename, originalMimeType);
    }

    switch (config.processing.convertToFormat) {
        case OutputFormat::Jpeg:
            return {config.normalizeExtensions ? changeExtensionToJpg(originalFilename) : originalFilename, kJpegMimeType};
        case OutputFormat::Webp:
            return {config.normalizeExtensions ? changeExtensionToWebp(originalFilename) : originalFilename, kWebpMimeType};
        case OutputFormat::None:
            break;
    }

    // Compressed without a conversion target cannot come out of processImage
    LOG_WARN << "Compressed result without conversion target for " << originalFilename;
    return keepOriginal(originalFilename, originalMimeType);
}

}
