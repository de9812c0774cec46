#ifndef IMGRELAY_IMAGE_CODEC_HPP
#define IMGRELAY_IMAGE_CODEC_HPP

#include <support/config.hpp>
#include <support/dimensions.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace imgrelay::image {
    enum class ImageFormat {
        Unknown,
        Jpeg,
        Png,
        Webp
    };

    const char* toString(ImageFormat format);

    // Detects the container from magic bytes only. Does not validate the payload.
    ImageFormat detectFormat(const std::string& data);

    class CodecError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ImageMetadata {
        ImageFormat format = ImageFormat::Unknown;
        Dimensions size;
        bool hasAlpha = false;
        int orientation = 1; // EXIF orientation, 1 when absent
    };

    struct EncodeOptions {
        Dimensions size;
        int quality = 90;
        OutputFormat format = OutputFormat::None; // None keeps the source format
    };

    /**
     * @brief Decode/resize/encode backend. Every operation throws CodecError when the
     *        input is not a decodable image or the library call fails.
     */
    class ImageCodec {
    public:
        virtual ~ImageCodec() = default;

        virtual ImageMetadata decodeMetadata(const std::string& data) const = 0;
        virtual std::string transformEncode(const std::string& data, const EncodeOptions& options) const = 0;
        // Applies the EXIF orientation to the pixels. The result carries orientation 1.
        virtual std::string autoRotate(const std::string& data) const = 0;
    };

    // JPEG through TurboJPEG, PNG through libpng, WebP through libwebp.
    class NativeImageCodec : public ImageCodec {
    public:
        static constexpr uint64_t kDefaultMaxPixels = 100000000;

        // Images with more than maxPixels pixels are refused before any pixel buffer is allocated.
        explicit NativeImageCodec(uint64_t maxPixels = kDefaultMaxPixels) : maxPixels_(maxPixels) {}

        ImageMetadata decodeMetadata(const std::string& data) const override;
        std::string transformEncode(const std::string& data, const EncodeOptions& options) const override;
        std::string autoRotate(const std::string& data) const override;

    private:
        void checkPixelBudget(const Dimensions& size) const;

        uint64_t maxPixels_;
    };
}

#endif // IMGRELAY_IMAGE_CODEC_HPP
