#include "image_collate/features/feature_extractor.hpp"
#include "image_collate/core/errors.hpp"
#include "image_collate/image/processing.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>

namespace image_collate::features {

double compute_whiteness(const cv::Mat& bgr, int threshold) {
    if (bgr.empty()) return 0.0;
    cv::Mat mask;
    const double t = static_cast<double>(threshold);
    cv::inRange(bgr, cv::Scalar(t, t, t), cv::Scalar(255, 255, 255), mask);
    return static_cast<double>(cv::countNonZero(mask)) / static_cast<double>(bgr.total());
}

double compute_blackness(const cv::Mat& bgr, int threshold) {
    if (bgr.empty()) return 0.0;
    cv::Mat mask;
    const double t = static_cast<double>(threshold);
    cv::inRange(bgr, cv::Scalar(0, 0, 0), cv::Scalar(t, t, t), mask);
    return static_cast<double>(cv::countNonZero(mask)) / static_cast<double>(bgr.total());
}

Color3d compute_dominant_color(const cv::Mat& bgr, int sample) {
    if (bgr.empty()) return Color3d::Zero();

    cv::Mat small;
    if (sample > 0 && (bgr.cols != sample || bgr.rows != sample)) {
        cv::resize(bgr, small, cv::Size(sample, sample), 0.0, 0.0, cv::INTER_AREA);
    } else {
        small = bgr;
    }

    const cv::Scalar m = cv::mean(small);
    return Color3d(m[2], m[1], m[0]);
}

FeatureExtractor::FeatureExtractor(const io::ImageCodec& codec, const PerceptualHasher& hasher,
                                   GridSpec grid, FeatureParams params)
    : codec_(codec), hasher_(hasher), grid_(grid), params_(params) {}

ImageRecord FeatureExtractor::extract(const fs::path& path) const {
    cv::Mat decoded = codec_.decode(path);
    return extract_from(path.filename().string(), decoded);
}

ImageRecord FeatureExtractor::extract_from(const std::string& filename,
                                           const cv::Mat& decoded) const {
    if (decoded.empty()) {
        throw DecodeError("empty image: " + filename);
    }

    cv::Mat work = codec_.resize(decoded, grid_.cell_width, grid_.cell_height);

    if (params_.autocontrast) {
        work = image::autocontrast(work);
    }
    if (std::fabs(params_.sharpness - 1.0f) > 1e-6f) {
        work = image::enhance_sharpness(work, params_.sharpness);
    }

    ImageRecord rec;
    rec.filename = filename;
    rec.fingerprint = hasher_.hash(work);
    rec.dominant_color = compute_dominant_color(work, params_.dominant_color_sample);
    rec.whiteness = compute_whiteness(work, params_.white_threshold);
    rec.blackness = compute_blackness(work, params_.black_threshold);
    rec.pixels = std::move(work);
    return rec;
}

} // namespace image_collate::features
