#include "image_collate/io/image_codec.hpp"
#include "image_collate/core/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace image_collate::io {

cv::Mat OpenCvImageCodec::decode(const fs::path& path) const {
    cv::Mat img;
    try {
        img = cv::imread(path.string(), cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw DecodeError(path.string() + ": " + e.what());
    }
    if (img.empty()) {
        throw DecodeError("Cannot decode image: " + path.string());
    }
    return img;
}

cv::Mat OpenCvImageCodec::resize(const cv::Mat& image, int width, int height) const {
    if (image.empty() || width < 1 || height < 1) {
        throw DecodeError("Cannot resize empty image");
    }
    if (image.cols == width && image.rows == height) {
        return image.clone();
    }

    // Area averaging when shrinking, cubic when enlarging
    const bool shrinking = width < image.cols && height < image.rows;
    cv::Mat out;
    try {
        cv::resize(image, out, cv::Size(width, height), 0.0, 0.0,
                   shrinking ? cv::INTER_AREA : cv::INTER_CUBIC);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("resize failed: ") + e.what());
    }
    return out;
}

void OpenCvImageCodec::save(const fs::path& path, const cv::Mat& image) const {
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), image);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write " + path.string());
    }
}

} // namespace image_collate::io
