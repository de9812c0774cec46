#include <drogon/drogon_test.h>
#include <support/file_identity.hpp>
#include <support/image_pipeline.hpp>
#include <support/image_utils.hpp>
#include <map>
#include <new>
#include <vector>

using namespace imgrelay;
using namespace imgrelay::image;

namespace {
    // Codec with scripted answers keyed by input bytes
    class FakeCodec : public ImageCodec {
    public:
        std::map<std::string, ImageMetadata> metadata;
        std::map<std::string, std::string> rotated;
        // transformEncode output per requested format; absent means failure
        std::map<OutputFormat, std::string> encoded;
        bool failRotate = false;
        bool exhaustMemory = false;

        mutable std::vector<std::string> transformInputs;
        mutable std::vector<EncodeOptions> transformOptions;

        ImageMetadata decodeMetadata(const std::string& data) const override {
            auto it = metadata.find(data);
            if (it == metadata.end()) throw CodecError("unsupported image format");
            return it->second;
        }

        std::string transformEncode(const std::string& data, const EncodeOptions& options) const override {
            decodeMetadata(data);
            if (exhaustMemory) throw std::bad_alloc();
            transformInputs.push_back(data);
            transformOptions.push_back(options);
            auto it = encoded.find(options.format);
            if (it == encoded.end()) throw CodecError("encoder failed");
            return it->second;
        }

        std::string autoRotate(const std::string& data) const override {
            if (failRotate) throw CodecError("rotation failed");
            auto it = rotated.find(data);
            if (it == rotated.end()) return data;
            return it->second;
        }
    };

    ImageMetadata meta(ImageFormat format, int width, int height, bool alpha = false, int orientation = 1) {
        ImageMetadata m;
        m.format = format;
        m.size = {width, height};
        m.hasAlpha = alpha;
        m.orientation = orientation;
        return m;
    }

    ProcessingSettings settingsFor(OutputFormat format) {
        ProcessingSettings settings;
        settings.convertToFormat = format;
        return settings;
    }
}

DROGON_TEST(TransparentImageSkipsConversion)
{
    const std::string png = "PNG-with-alpha-bytes";
    FakeCodec codec;
    codec.metadata[png] = meta(ImageFormat::Png, 3000, 2000, true);
    codec.encoded[OutputFormat::Webp] = "w";

    ProcessingResult result = processImage(png, settingsFor(OutputFormat::Webp), codec);
    CHECK(result.processedData == png);
    CHECK(!result.wasCompressed);
    CHECK(!result.wasResized);
    CHECK(!result.processingError.has_value());
    CHECK(result.newDimensions == (Dimensions{3000, 2000}));
    CHECK(codec.transformInputs.empty());

    FileIdentity identity = reconcileFileIdentity("logo.png", "image/png", result, [] {
        Config config;
        config.processing.convertToFormat = OutputFormat::Webp;
        return config;
    }());
    CHECK(identity.filename == "logo.png");
    CHECK(identity.mimeType == "image/png");
}

DROGON_TEST(LargerConversionIsDiscarded)
{
    const std::string jpeg(1000, 'j');
    FakeCodec codec;
    codec.metadata[jpeg] = meta(ImageFormat::Jpeg, 800, 600);
    codec.encoded[OutputFormat::Jpeg] = std::string(1500, 'q');

    ProcessingSettings settings = settingsFor(OutputFormat::Jpeg);
    settings.jpegQuality = 100;
    ProcessingResult result = processImage(jpeg, settings, codec);
    CHECK(result.processedData == jpeg);
    CHECK(!result.wasCompressed);
    CHECK(!result.wasResized);
    CHECK(result.newDimensions == (Dimensions{800, 600}));
    REQUIRE(codec.transformOptions.size() == 1);
    CHECK(codec.transformOptions[0].quality == 100);

    // An equal size is not an improvement either
    codec.encoded[OutputFormat::Jpeg] = std::string(1000, 'q');
    result = processImage(jpeg, settings, codec);
    CHECK(result.processedData == jpeg);
    CHECK(!result.wasCompressed);
}

DROGON_TEST(SmallerConversionIsAdopted)
{
    const std::string png(5000, 'p');
    FakeCodec codec;
    codec.metadata[png] = meta(ImageFormat::Png, 3000, 2000);
    codec.encoded[OutputFormat::Jpeg] = std::string(700, 'j');

    ProcessingResult result = processImage(png, settingsFor(OutputFormat::Jpeg), codec);
    CHECK(result.processedData == std::string(700, 'j'));
    CHECK(result.wasCompressed);
    CHECK(result.wasResized);
    CHECK(result.newDimensions == (Dimensions{1620, 1080}));
    REQUIRE(codec.transformOptions.size() == 1);
    CHECK(codec.transformOptions[0].size == (Dimensions{1620, 1080}));
    CHECK(codec.transformOptions[0].format == OutputFormat::Jpeg);
    CHECK(codec.transformOptions[0].quality == 90);

    Config config;
    config.processing.convertToFormat = OutputFormat::Jpeg;
    FileIdentity identity = reconcileFileIdentity("photo.png", "image/png", result, config);
    CHECK(identity.filename == "photo.JPG");
    CHECK(identity.mimeType == "image/jpeg");
}

DROGON_TEST(WebpConversionUsesWebpQuality)
{
    const std::string jpeg(4000, 'j');
    FakeCodec codec;
    codec.metadata[jpeg] = meta(ImageFormat::Jpeg, 1024, 768);
    codec.encoded[OutputFormat::Webp] = std::string(900, 'w');

    ProcessingSettings settings = settingsFor(OutputFormat::Webp);
    settings.webpQuality = 70;
    ProcessingResult result = processImage(jpeg, settings, codec);
    CHECK(result.wasCompressed);
    CHECK(!result.wasResized);
    REQUIRE(codec.transformOptions.size() == 1);
    CHECK(codec.transformOptions[0].quality == 70);
    CHECK(codec.transformOptions[0].size == (Dimensions{1024, 768}));
}

DROGON_TEST(ResizeWithoutConversion)
{
    const std::string webp(3000, 'w');
    FakeCodec codec;
    codec.metadata[webp] = meta(ImageFormat::Webp, 2000, 3000);
    codec.encoded[OutputFormat::None] = std::string(4000, 'r');

    ProcessingSettings settings;
    settings.webpQuality = 60;
    ProcessingResult result = processImage(webp, settings, codec);
    // A same-format re-encode is adopted even when larger
    CHECK(result.processedData == std::string(4000, 'r'));
    CHECK(result.wasResized);
    CHECK(!result.wasCompressed);
    CHECK(result.newDimensions == (Dimensions{1080, 1620}));
    REQUIRE(codec.transformOptions.size() == 1);
    CHECK(codec.transformOptions[0].quality == 60);
    CHECK(codec.transformOptions[0].format == OutputFormat::None);
}

DROGON_TEST(NothingToDo)
{
    const std::string jpeg = "small-jpeg";
    FakeCodec codec;
    codec.metadata[jpeg] = meta(ImageFormat::Jpeg, 640, 480);

    ProcessingResult result = processImage(jpeg, ProcessingSettings(), codec);
    CHECK(result.processedData == jpeg);
    CHECK(!result.wasResized);
    CHECK(!result.wasCompressed);
    CHECK(!result.processingError.has_value());
    CHECK(result.newDimensions == (Dimensions{640, 480}));
    CHECK(codec.transformInputs.empty());
}

DROGON_TEST(NonImagePassesThrough)
{
    const std::string pdf = "%PDF-1.7 not an image";
    FakeCodec codec;

    for (OutputFormat format : {OutputFormat::None, OutputFormat::Jpeg, OutputFormat::Webp}) {
        ProcessingResult result = processImage(pdf, settingsFor(format), codec);
        CHECK(result.processedData == pdf);
        CHECK(result.processingError.has_value());
        CHECK(!result.wasCompressed);
        CHECK(!result.wasResized);
    }
}

DROGON_TEST(EncoderFailureKeepsBaseline)
{
    const std::string jpeg(2000, 'j');
    FakeCodec codec;
    codec.metadata[jpeg] = meta(ImageFormat::Jpeg, 4000, 3000);

    ProcessingResult resized = processImage(jpeg, ProcessingSettings(), codec);
    CHECK(resized.processedData == jpeg);
    CHECK(resized.processingError.has_value());
    CHECK(!resized.wasResized);
    CHECK(resized.newDimensions == (Dimensions{4000, 3000}));

    ProcessingResult converted = processImage(jpeg, settingsFor(OutputFormat::Webp), codec);
    CHECK(converted.processedData == jpeg);
    CHECK(converted.processingError.has_value());
    CHECK(!converted.wasCompressed);
}

DROGON_TEST(AllocationFailureKeepsBaseline)
{
    const std::string png(500, 'p');
    FakeCodec codec;
    codec.metadata[png] = meta(ImageFormat::Png, 6000, 4000);
    codec.exhaustMemory = true;

    ProcessingResult resized = processImage(png, ProcessingSettings(), codec);
    CHECK(resized.processedData == png);
    CHECK(resized.processingError.has_value());
    CHECK(!resized.wasResized);

    ProcessingResult converted = processImage(png, settingsFor(OutputFormat::Jpeg), codec);
    CHECK(converted.processedData == png);
    CHECK(converted.processingError.has_value());
    CHECK(!converted.wasCompressed);
}

DROGON_TEST(RotatedBytesAreTheBaseline)
{
    // EXIF orientation 6: stored landscape, displayed portrait
    const std::string original(6000, 'o');
    const std::string upright(6100, 'u');
    FakeCodec codec;
    codec.metadata[original] = meta(ImageFormat::Jpeg, 4000, 3000, false, 6);
    codec.metadata[upright] = meta(ImageFormat::Jpeg, 3000, 4000);
    codec.rotated[original] = upright;
    codec.encoded[OutputFormat::Webp] = std::string(6050, 'w');

    ProcessingResult result = processImage(original, settingsFor(OutputFormat::Webp), codec);
    // Compared against the rotated bytes, 6050 is smaller
    CHECK(result.wasCompressed);
    CHECK(result.wasResized);
    CHECK(result.newDimensions == (Dimensions{1080, 1440}));
    REQUIRE(codec.transformInputs.size() == 1);
    CHECK(codec.transformInputs[0] == upright);

    // A rejected conversion still hands out the upright image
    codec.encoded[OutputFormat::Webp] = std::string(6100, 'w');
    result = processImage(original, settingsFor(OutputFormat::Webp), codec);
    CHECK(result.processedData == upright);
    CHECK(!result.wasCompressed);
    CHECK(result.newDimensions == (Dimensions{3000, 4000}));
}

DROGON_TEST(RotationFailureFallsBackToOriginal)
{
    const std::string original = "sideways-jpeg";
    FakeCodec codec;
    codec.metadata[original] = meta(ImageFormat::Jpeg, 800, 600, false, 8);
    codec.failRotate = true;

    OrientationResult oriented = correctOrientation(codec, original);
    CHECK(oriented.data == original);
    CHECK(!oriented.rotated);

    ProcessingResult result = processImage(original, ProcessingSettings(), codec);
    CHECK(result.processedData == original);
    CHECK(!result.processingError.has_value());
}

DROGON_TEST(TransparencyDetection)
{
    FakeCodec codec;
    codec.metadata["alpha"] = meta(ImageFormat::Png, 10, 10, true);
    codec.metadata["opaque"] = meta(ImageFormat::Png, 10, 10, false);

    CHECK(detectTransparency(codec, "alpha") == std::optional<bool>(true));
    CHECK(detectTransparency(codec, "opaque") == std::optional<bool>(false));
    CHECK(!detectTransparency(codec, "garbage").has_value());
}

DROGON_TEST(CompressionIsMonotonic)
{
    const std::string source(1000, 's');
    for (size_t outputSize : {1u, 500u, 999u, 1000u, 1001u, 5000u}) {
        FakeCodec codec;
        codec.metadata[source] = meta(ImageFormat::Png, 500, 500);
        codec.encoded[OutputFormat::Jpeg] = std::string(outputSize, 'c');

        ProcessingResult result = processImage(source, settingsFor(OutputFormat::Jpeg), codec);
        CHECK(result.processedData.size() <= source.size());
        CHECK(result.wasCompressed == (outputSize < source.size()));
        if (!result.wasCompressed) {
            CHECK(result.processedData == source);
        }
    }
}
