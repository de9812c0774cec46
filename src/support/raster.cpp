#include <support/raster.hpp>
#include <support/image_codec.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace imgrelay::image {

Raster resample(const Raster& source, const Dimensions& target) {
    if (target.width <= 0 || target.height <= 0) {
        throw CodecError("invalid target size " + std::to_string(target.width) + "x" + std::to_string(target.height));
    }
    if (source.width == target.width && source.height == target.height) {
        return source;
    }

    const int type = source.channels == 4 ? CV_8UC4 : CV_8UC3;
    // Wraps the source pixels without copying
    cv::Mat src(source.height, source.width, type, const_cast<unsigned char*>(source.pixels.data()));

    Raster result(target.width, target.height, source.channels);
    cv::Mat dst(target.height, target.width, type, result.pixels.data());
    try {
        cv::resize(src, dst, cv::Size(target.width, target.height), 0, 0, cv::INTER_AREA);
    } catch (const cv::Exception& e) {
        throw CodecError(std::string("resize failed: ") + e.what());
    }
    return result;
}

}
