#include <support/reformat.hpp>
#include <support/file_identity.hpp>
#include <support/image_pipeline.hpp>
#include <drogon/drogon.h>
#include <algorithm>

namespace imgrelay {

ReformatResult reformat(const MultipartForm& form, const Config& config, const image::ImageCodec& codec) {
    ReformatResult output;

    auto filePart = std::find_if(form.parts.begin(), form.parts.end(), [&config](const MultipartPart& part) {
        return part.isFile() && part.name == config.fileUploadField;
    });
    if (filePart == form.parts.end()) {
        output.error = "missing file field " + config.fileUploadField;
        return output;
    }

    image::ProcessingResult result = image::processImage(filePart->data, config.processing, codec);
    if (result.processingError) {
        LOG_INFO << "Image processing error for " << *filePart->filename << ": " << *result.processingError;
    }

    MultipartWriter writer;
    for (const auto& part : form.parts) {
        if (!part.isFile()) {
            writer.addField(part.name, part.data);
        } else if (&part != &*filePart) {
            LOG_WARN << "Dropping extra file part " << part.name << " (" << *part.filename << ")";
        }
    }

    FileIdentity identity = reconcileFileIdentity(*filePart->filename, filePart->contentType, result, config);
    writer.addFile(config.fileUploadField, identity.filename, identity.mimeType, result.processedData);

    LOG_INFO << "Rebuilt upload " << *filePart->filename << " -> " << identity.filename << " (" << identity.mimeType
             << "): " << filePart->data.size() << " -> " << result.processedData.size() << " bytes";

    output.contentType = writer.contentType();
    output.body = writer.finish();
    return output;
}

}
