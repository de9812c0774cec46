#include <support/multipart.hpp>
#include <drogon/utils/Utilities.h>
#include <algorithm>
#include <cctype>
#include <utility>

namespace imgrelay {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// key=value pairs after the first ';' of a header value, keys lowercased
std::vector<std::pair<std::string, std::string>> parseParameters(const std::string& headerValue) {
    std::vector<std::pair<std::string, std::string>> params;
    size_t pos = headerValue.find(';');
    while (pos != std::string::npos && pos < headerValue.size()) {
        ++pos; // skip ';'
        size_t eq = headerValue.find('=', pos);
        size_t semicolon = headerValue.find(';', pos);
        if (eq == std::string::npos || (semicolon != std::string::npos && semicolon < eq)) {
            pos = semicolon;
            continue;
        }

        std::string key = toLower(trim(headerValue.substr(pos, eq - pos)));
        size_t valueStart = headerValue.find_first_not_of(" \t", eq + 1);
        std::string value;
        if (valueStart != std::string::npos && headerValue[valueStart] == '"') {
            size_t i = valueStart + 1;
            for (; i < headerValue.size() && headerValue[i] != '"'; ++i) {
                if (headerValue[i] == '\\' && i + 1 < headerValue.size()) ++i;
                value += headerValue[i];
            }
            pos = headerValue.find(';', i);
        } else {
            size_t end = headerValue.find(';', eq + 1);
            value = trim(headerValue.substr(eq + 1, end == std::string::npos ? std::string::npos : end - eq - 1));
            pos = end;
        }
        params.emplace_back(std::move(key), std::move(value));
    }
    return params;
}

// Fills name/filename/contentType from the header block of one part
void parsePartHeaders(const std::string& block, MultipartPart& part) {
    size_t lineStart = 0;
    while (lineStart < block.size()) {
        size_t lineEnd = block.find("\r\n", lineStart);
        if (lineEnd == std::string::npos) lineEnd = block.size();
        std::string line = block.substr(lineStart, lineEnd - lineStart);
        lineStart = lineEnd + 2;

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string field = toLower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (field == "content-disposition") {
            for (auto& [key, paramValue] : parseParameters(value)) {
                if (key == "name") {
                    part.name = std::move(paramValue);
                } else if (key == "filename") {
                    part.filename = std::move(paramValue);
                }
            }
        } else if (field == "content-type") {
            part.contentType = value;
        }
    }
}

}

bool isMultipartFormData(const std::string& contentType) {
    std::string mediaType = toLower(trim(contentType.substr(0, contentType.find(';'))));
    return mediaType == "multipart/form-data";
}

std::string extractBoundary(const std::string& contentType) {
    for (const auto& [key, value] : parseParameters(contentType)) {
        if (key == "boundary") return value;
    }
    return "";
}

// Not drogon::MultiPartParser: its HttpFile reduces a part's Content-Type to an enum, and the declared string must be echoed downstream.
std::optional<MultipartForm> parseMultipartForm(const std::string& body, const std::string& boundary) {
    if (boundary.empty()) return std::nullopt;

    const std::string delimiter = "--" + boundary;
    const std::string partSeparator = "\r\n" + delimiter;

    size_t pos = body.find(delimiter);
    if (pos == std::string::npos) return std::nullopt;
    // A delimiter not at the start must follow a line break (preamble)
    if (pos != 0 && (pos < 2 || body.compare(pos - 2, 2, "\r\n") != 0)) return std::nullopt;
    pos += delimiter.size();

    MultipartForm form;
    while (true) {
        if (body.compare(pos, 2, "--") == 0) {
            return form; // close delimiter
        }
        pos = body.find_first_not_of(" \t", pos); // transport padding
        if (pos == std::string::npos || body.compare(pos, 2, "\r\n") != 0) return std::nullopt;
        pos += 2;

        size_t contentStart;
        std::string headerBlock;
        if (body.compare(pos, 2, "\r\n") == 0) {
            contentStart = pos + 2;
        } else {
            size_t headersEnd = body.find("\r\n\r\n", pos);
            if (headersEnd == std::string::npos) return std::nullopt;
            headerBlock = body.substr(pos, headersEnd - pos);
            contentStart = headersEnd + 4;
        }

        size_t next = body.find(partSeparator, contentStart);
        if (next == std::string::npos) return std::nullopt;

        MultipartPart part;
        parsePartHeaders(headerBlock, part);
        if (!part.name.empty()) {
            part.data = body.substr(contentStart, next - contentStart);
            form.parts.push_back(std::move(part));
        }
        pos = next + partSeparator.size();
    }
}

std::string escapeQuotes(const std::string& s) {
    std::string escaped;
    escaped.reserve(s.size());
    for (char c : s) {
        if (c == '\\' || c == '"') escaped += '\\';
        escaped += c;
    }
    return escaped;
}

MultipartWriter::MultipartWriter() : MultipartWriter(drogon::utils::genRandomString(32)) {}

MultipartWriter::MultipartWriter(std::string boundary) : boundary_(std::move(boundary)) {}

std::string MultipartWriter::contentType() const {
    return "multipart/form-data; boundary=" + boundary_;
}

void MultipartWriter::beginPart() {
    body_.append(hasParts_ ? "\r\n--" : "--").append(boundary_).append("\r\n");
    hasParts_ = true;
}

void MultipartWriter::addField(const std::string& name, const std::string& value) {
    beginPart();
    body_.append("Content-Disposition: form-data; name=\"").append(escapeQuotes(name)).append("\"\r\n\r\n");
    body_.append(value);
}

void MultipartWriter::addFile(const std::string& fieldName, const std::string& filename,
                              const std::string& mimeType, const std::string& data) {
    beginPart();
    body_.append("Content-Disposition: form-data; name=\"").append(escapeQuotes(fieldName))
         .append("\"; filename=\"").append(escapeQuotes(filename)).append("\"\r\n");
    body_.append("Content-Type: ").append(mimeType).append("\r\n\r\n");
    body_.append(data);
}

std::string MultipartWriter::finish() {
    body_.append(hasParts_ ? "\r\n--" : "--").append(boundary_).append("--\r\n");
    hasParts_ = false;
    return std::move(body_);
}

}
