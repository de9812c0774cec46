#ifndef IMGRELAY_MULTIPART_HPP
#define IMGRELAY_MULTIPART_HPP

#include <optional>
#include <string>
#include <vector>

namespace imgrelay {
    struct MultipartPart {
        std::string name;
        std::optional<std::string> filename;
        std::string contentType; // empty when the part declares none
        std::string data;

        // Same rule as browsers and Go's multipart reader: an empty filename is a plain field
        bool isFile() const { return filename.has_value() && !filename->empty(); }
    };

    struct MultipartForm {
        std::vector<MultipartPart> parts;
    };

    // True for "multipart/form-data" media types, parameters ignored.
    bool isMultipartFormData(const std::string& contentType);

    // The boundary parameter of a Content-Type value (quoted or bare), empty if absent.
    std::string extractBoundary(const std::string& contentType);

    /**
     * @brief Parses a multipart/form-data body. Parts keep their order; parts without a
     *        name are skipped.
     * @param body Raw request body.
     * @param boundary Boundary without the leading "--".
     * @return std::nullopt when the body is structurally invalid.
     */
    std::optional<MultipartForm> parseMultipartForm(const std::string& body, const std::string& boundary);

    // Escapes backslashes and double quotes for a Content-Disposition parameter.
    std::string escapeQuotes(const std::string& s);

    class MultipartWriter {
    public:
        MultipartWriter();
        explicit MultipartWriter(std::string boundary);

        const std::string& boundary() const { return boundary_; }
        // "multipart/form-data; boundary=..."
        std::string contentType() const;

        void addField(const std::string& name, const std::string& value);
        void addFile(const std::string& fieldName, const std::string& filename,
                     const std::string& mimeType, const std::string& data);

        // Appends the closing delimiter and hands over the body.
        std::string finish();

    private:
        void beginPart();

        std::string boundary_;
        std::string body_;
        bool hasParts_ = false;
    };
}

#endif // IMGRELAY_MULTIPART_HPP
