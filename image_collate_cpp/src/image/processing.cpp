#include "image_collate/image/processing.hpp"
#include "image_collate/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <array>
#include <cmath>
#include <vector>

namespace image_collate::image {

cv::Mat autocontrast(const cv::Mat& bgr) {
    if (bgr.empty()) return bgr;

    std::vector<cv::Mat> channels;
    cv::split(bgr, channels);
    for (auto& ch : channels) {
        double lo = 0.0, hi = 0.0;
        cv::minMaxLoc(ch, &lo, &hi);
        if (hi <= lo) continue;
        const double scale = 255.0 / (hi - lo);
        ch.convertTo(ch, CV_8U, scale, -lo * scale);
    }

    cv::Mat out;
    cv::merge(channels, out);
    return out;
}

cv::Mat enhance_sharpness(const cv::Mat& bgr, float factor) {
    if (bgr.empty()) return bgr;
    if (std::fabs(factor - 1.0f) < 1e-6f) return bgr.clone();

    cv::Mat kernel = (cv::Mat_<float>(3, 3) << 1, 1, 1,
                                                1, 5, 1,
                                                1, 1, 1) / 13.0f;
    cv::Mat smooth;
    cv::filter2D(bgr, smooth, -1, kernel, cv::Point(-1, -1), 0.0, cv::BORDER_REPLICATE);

    // Edge pixels keep their original values.
    if (bgr.rows > 2 && bgr.cols > 2) {
        bgr.row(0).copyTo(smooth.row(0));
        bgr.row(bgr.rows - 1).copyTo(smooth.row(bgr.rows - 1));
        bgr.col(0).copyTo(smooth.col(0));
        bgr.col(bgr.cols - 1).copyTo(smooth.col(bgr.cols - 1));
    }

    cv::Mat out;
    cv::addWeighted(smooth, 1.0 - factor, bgr, factor, 0.0, out);
    return out;
}

namespace {

bool row_is_dark(const cv::Mat& img, int y, int x0, int x1, int tol) {
    for (int x = x0; x < x1; ++x) {
        const cv::Vec3b& p = img.at<cv::Vec3b>(y, x);
        if (p[0] > tol || p[1] > tol || p[2] > tol) return false;
    }
    return true;
}

bool col_is_dark(const cv::Mat& img, int x, int y0, int y1, int tol) {
    for (int y = y0; y < y1; ++y) {
        const cv::Vec3b& p = img.at<cv::Vec3b>(y, x);
        if (p[0] > tol || p[1] > tol || p[2] > tol) return false;
    }
    return true;
}

} // namespace

BorderBox detect_borders(const cv::Mat& bgr, int tolerance) {
    if (bgr.empty() || bgr.type() != CV_8UC3) {
        throw ValidationError("detect_borders expects a non-empty 8-bit BGR image");
    }

    BorderBox box{0, 0, bgr.cols, bgr.rows};

    while (box.top < box.bottom && row_is_dark(bgr, box.top, 0, bgr.cols, tolerance)) {
        ++box.top;
    }
    while (box.bottom > box.top && row_is_dark(bgr, box.bottom - 1, 0, bgr.cols, tolerance)) {
        --box.bottom;
    }
    while (box.left < box.right &&
           col_is_dark(bgr, box.left, 0, bgr.rows, tolerance)) {
        ++box.left;
    }
    while (box.right > box.left &&
           col_is_dark(bgr, box.right - 1, 0, bgr.rows, tolerance)) {
        --box.right;
    }

    // Entirely dark frame: keep the full image.
    if (box.empty()) {
        return BorderBox{0, 0, bgr.cols, bgr.rows};
    }
    return box;
}

bool has_significant_borders(const BorderBox& box, int width, int height, float threshold) {
    if (width <= 0 || height <= 0) return false;
    const double keep = 1.0 - static_cast<double>(threshold);
    return box.width() < width * keep || box.height() < height * keep;
}

std::string aspect_class_to_string(AspectClass c) {
    switch (c) {
        case AspectClass::EXTRA_TALL: return "extra_tall";
        case AspectClass::PORTRAIT: return "portrait";
        case AspectClass::SQUARE: return "square";
        case AspectClass::LANDSCAPE: return "landscape";
        case AspectClass::EXTRA_WIDE: return "extra_wide";
        default: return "unknown";
    }
}

AspectClass classify_aspect_ratio(double aspect_ratio) {
    static const std::array<std::pair<AspectClass, double>, 5> kClasses{{
        {AspectClass::EXTRA_TALL, 0.6},
        {AspectClass::PORTRAIT, 0.9},
        {AspectClass::SQUARE, 1.0},
        {AspectClass::LANDSCAPE, 1.75},
        {AspectClass::EXTRA_WIDE, 2.25},
    }};

    AspectClass best = kClasses[0].first;
    double best_dist = std::fabs(aspect_ratio - kClasses[0].second);
    for (size_t i = 1; i < kClasses.size(); ++i) {
        const double d = std::fabs(aspect_ratio - kClasses[i].second);
        if (d < best_dist) {
            best_dist = d;
            best = kClasses[i].first;
        }
    }
    return best;
}

} // namespace image_collate::image
