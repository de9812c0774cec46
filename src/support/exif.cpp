#include <support/exif.hpp>
#include <cstdint>
#include <cstring>
#include <optional>

namespace imgrelay::image {

namespace {

constexpr uint16_t kOrientationTag = 0x0112;
constexpr uint16_t kTypeShort = 3;

struct Segment {
    size_t offset; // position of the 0xFF marker byte
    size_t length; // marker + length field + payload
};

// Walks the marker segments that precede the scan data
std::vector<Segment> scanSegments(const std::string& data) {
    std::vector<Segment> segments;
    if (data.size() < 4) return segments;
    if ((unsigned char)data[0] != 0xFF || (unsigned char)data[1] != 0xD8) return segments;

    size_t pos = 2;
    while (pos + 4 <= data.size()) {
        if ((unsigned char)data[pos] != 0xFF) break;
        unsigned char marker = (unsigned char)data[pos + 1];
        if (marker == 0xD9) break; // EOI
        if (marker == 0xDA) break; // SOS - image data follows

        unsigned int length = ((unsigned char)data[pos + 2] << 8) | (unsigned char)data[pos + 3];
        if (length < 2 || pos + 2 + length > data.size()) break;

        segments.push_back({pos, 2 + static_cast<size_t>(length)});
        pos += 2 + length;
    }
    return segments;
}

uint16_t read16(const unsigned char* data, bool isLittleEndian) {
    if (isLittleEndian) return data[0] | (data[1] << 8);
    return (data[0] << 8) | data[1];
}

uint32_t read32(const unsigned char* data, bool isLittleEndian) {
    if (isLittleEndian) return data[0] | (data[1] << 8) | (data[2] << 16) | ((uint32_t)data[3] << 24);
    return ((uint32_t)data[0] << 24) | (data[1] << 16) | (data[2] << 8) | data[3];
}

struct OrientationField {
    size_t offset; // absolute position of the 16-bit value
    bool isLittleEndian;
};

std::optional<OrientationField> findOrientationField(const std::string& data) {
    for (const auto& seg : scanSegments(data)) {
        const auto* base = reinterpret_cast<const unsigned char*>(data.data()) + seg.offset;
        if (base[1] != 0xE1 || seg.length <= 18) continue; // APP1 with room for a TIFF header
        if (std::memcmp(base + 4, "Exif\0\0", 6) != 0) continue;

        const unsigned char* tiffBase = base + 10;
        const size_t tiffSize = seg.length - 10;
        bool isLittleEndian;
        if (tiffBase[0] == 'I' && tiffBase[1] == 'I') {
            isLittleEndian = true;
        } else if (tiffBase[0] == 'M' && tiffBase[1] == 'M') {
            isLittleEndian = false;
        } else {
            continue;
        }

        uint32_t ifdOffset = read32(tiffBase + 4, isLittleEndian);
        if (static_cast<size_t>(ifdOffset) + 2 > tiffSize) continue;

        uint16_t numEntries = read16(tiffBase + ifdOffset, isLittleEndian);
        for (int i = 0; i < numEntries; ++i) {
            size_t entryOffset = static_cast<size_t>(ifdOffset) + 2 + static_cast<size_t>(i) * 12;
            if (entryOffset + 12 > tiffSize) break;

            uint16_t tag = read16(tiffBase + entryOffset, isLittleEndian);
            uint16_t type = read16(tiffBase + entryOffset + 2, isLittleEndian);
            if (tag == kOrientationTag && type == kTypeShort) {
                return OrientationField{seg.offset + 10 + entryOffset + 8, isLittleEndian};
            }
        }
    }
    return std::nullopt;
}

}

std::vector<std::string> extractAppSegments(const std::string& jpegData) {
    std::vector<std::string> segments;
    for (const auto& seg : scanSegments(jpegData)) {
        unsigned char marker = (unsigned char)jpegData[seg.offset + 1];
        // APP0 (JFIF) is written by the encoder itself
        if (marker >= 0xE1 && marker <= 0xEF) {
            segments.push_back(jpegData.substr(seg.offset, seg.length));
        }
    }
    return segments;
}

std::string insertAppSegments(const std::string& jpegData, const std::vector<std::string>& segments) {
    if (jpegData.size() < 2 || segments.empty()) return jpegData;

    size_t extra = 0;
    for (const auto& seg : segments) extra += seg.size();

    std::string result;
    result.reserve(jpegData.size() + extra);
    result.append(jpegData, 0, 2); // SOI (FF D8)
    for (const auto& seg : segments) {
        result.append(seg);
    }
    result.append(jpegData, 2, std::string::npos);
    return result;
}

int readExifOrientation(const std::string& jpegData) {
    auto field = findOrientationField(jpegData);
    if (!field) return 1;

    const auto* value = reinterpret_cast<const unsigned char*>(jpegData.data()) + field->offset;
    int orientation = read16(value, field->isLittleEndian);
    return (orientation >= 1 && orientation <= 8) ? orientation : 1;
}

std::string resetExifOrientation(std::string jpegData) {
    auto field = findOrientationField(jpegData);
    if (!field) return jpegData;

    if (field->isLittleEndian) {
        jpegData[field->offset] = 1;
        jpegData[field->offset + 1] = 0;
    } else {
        jpegData[field->offset] = 0;
        jpegData[field->offset + 1] = 1;
    }
    return jpegData;
}

}
