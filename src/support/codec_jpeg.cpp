#include <support/raster.hpp>
#include <support/image_codec.hpp>
#include <turbojpeg.h>
#include <memory>

namespace imgrelay::image {

namespace {

using TjHandle = std::unique_ptr<void, int (*)(tjhandle)>;

TjHandle makeHandle(tjhandle raw) {
    return TjHandle(raw, tjDestroy);
}

std::string tjError(tjhandle handle, const char* what) {
    return std::string(what) + ": " + tjGetErrorStr2(handle);
}

const unsigned char* bytes(const std::string& data) {
    return reinterpret_cast<const unsigned char*>(data.data());
}

// EXIF orientation -> lossless operation that brings the pixels upright
int orientationToTransform(int orientation) {
    switch (orientation) {
        case 2: return TJXOP_HFLIP;
        case 3: return TJXOP_ROT180;
        case 4: return TJXOP_VFLIP;
        case 5: return TJXOP_TRANSPOSE;
        case 6: return TJXOP_ROT90;
        case 7: return TJXOP_TRANSVERSE;
        case 8: return TJXOP_ROT270;
        default: return TJXOP_NONE;
    }
}

}

JpegInfo readJpegInfo(const std::string& data) {
    TjHandle decompressor = makeHandle(tjInitDecompress());
    if (!decompressor) throw CodecError("TurboJPEG init failed");

    int width, height, subsamp, colorspace;
    if (tjDecompressHeader3(decompressor.get(), bytes(data), data.size(), &width, &height, &subsamp, &colorspace) < 0) {
        throw CodecError(tjError(decompressor.get(), "TurboJPEG DecompressHeader failed"));
    }
    if (width <= 0 || height <= 0) throw CodecError("JPEG header reports empty image");
    return {{width, height}, subsamp};
}

Raster decodeJpeg(const std::string& data, const Dimensions& minimumSize) {
    TjHandle decompressor = makeHandle(tjInitDecompress());
    if (!decompressor) throw CodecError("TurboJPEG init failed");

    int width, height, subsamp, colorspace;
    if (tjDecompressHeader3(decompressor.get(), bytes(data), data.size(), &width, &height, &subsamp, &colorspace) < 0) {
        throw CodecError(tjError(decompressor.get(), "TurboJPEG DecompressHeader failed"));
    }

    // Let the DCT do the coarse part of a large downscale
    tjscalingfactor scalingFactor = {1, 1};
    int numFactors = 0;
    tjscalingfactor* factors = tjGetScalingFactors(&numFactors);
    for (int i = 0; factors && i < numFactors; ++i) {
        const tjscalingfactor& f = factors[i];
        if (f.num > f.denom) continue;
        int w = TJSCALED(width, f);
        int h = TJSCALED(height, f);
        if (w >= minimumSize.width && h >= minimumSize.height &&
            w < TJSCALED(width, scalingFactor)) {
            scalingFactor = f;
        }
    }

    int scaledWidth = TJSCALED(width, scalingFactor);
    int scaledHeight = TJSCALED(height, scalingFactor);

    Raster raster(scaledWidth, scaledHeight, 3);
    if (tjDecompress2(decompressor.get(), bytes(data), data.size(), raster.pixels.data(), scaledWidth, 0, scaledHeight, TJPF_RGB, TJFLAG_FASTDCT) < 0) {
        throw CodecError(tjError(decompressor.get(), "TurboJPEG decompress failed"));
    }
    return raster;
}

std::string encodeJpeg(const Raster& raster, int quality, int subsampling) {
    TjHandle compressor = makeHandle(tjInitCompress());
    if (!compressor) throw CodecError("TurboJPEG init failed");

    if (subsampling < 0) subsampling = TJSAMP_420;
    int pixelFormat = raster.channels == 4 ? TJPF_RGBA : TJPF_RGB;

    unsigned char* compressedData = nullptr;
    unsigned long compressedSize = 0;
    if (tjCompress2(compressor.get(), raster.pixels.data(), raster.width, 0, raster.height, pixelFormat,
                    &compressedData, &compressedSize, subsampling, quality, TJFLAG_FASTDCT) < 0) {
        if (compressedData) tjFree(compressedData);
        throw CodecError(tjError(compressor.get(), "TurboJPEG compress failed"));
    }

    std::string result(reinterpret_cast<char*>(compressedData), compressedSize);
    tjFree(compressedData);
    return result;
}

std::string transformJpeg(const std::string& data, int exifOrientation) {
    int op = orientationToTransform(exifOrientation);
    if (op == TJXOP_NONE) return data;

    TjHandle transformer = makeHandle(tjInitTransform());
    if (!transformer) throw CodecError("TurboJPEG init failed");

    tjtransform transform{};
    transform.op = op;
    // Partial edge MCUs cannot be transformed losslessly and are dropped
    transform.options = TJXOPT_TRIM;

    unsigned char* dstBuf = nullptr;
    unsigned long dstSize = 0;
    if (tjTransform(transformer.get(), bytes(data), data.size(), 1, &dstBuf, &dstSize, &transform, 0) < 0) {
        if (dstBuf) tjFree(dstBuf);
        throw CodecError(tjError(transformer.get(), "TurboJPEG transform failed"));
    }

    std::string result(reinterpret_cast<char*>(dstBuf), dstSize);
    tjFree(dstBuf);
    return result;
}

}
