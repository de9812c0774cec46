#ifndef IMGRELAY_REFORMAT_HPP
#define IMGRELAY_REFORMAT_HPP

#include <support/config.hpp>
#include <support/image_codec.hpp>
#include <support/multipart.hpp>
#include <string>

namespace imgrelay {
    struct ReformatResult {
        std::string contentType; // Content-Type header value for the new body
        std::string body;
        std::string error;       // empty on success

        bool ok() const { return error.empty(); }
    };

    /**
     * @brief Rebuilds an upload form: plain fields are copied in order, then the file named
     *        config.fileUploadField is written once with processed bytes and a reconciled
     *        filename and MIME type. Other file parts are dropped.
     * @return An error only when the form has no such file; image problems never fail here.
     */
    ReformatResult reformat(const MultipartForm& form, const Config& config, const image::ImageCodec& codec);
}

#endif // IMGRELAY_REFORMAT_HPP
