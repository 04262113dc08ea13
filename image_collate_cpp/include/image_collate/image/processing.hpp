#pragma once

#include "image_collate/core/types.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace image_collate::image {

// Per-channel linear stretch of [min,max] to [0,255].
cv::Mat autocontrast(const cv::Mat& bgr);

// Blend with a 3x3 smoothed copy: 0 = smoothed, 1 = original, >1 sharpened.
cv::Mat enhance_sharpness(const cv::Mat& bgr, float factor);

// Uniform dark frame around the content, as half-open [left,right) x [top,bottom).
struct BorderBox {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    bool empty() const { return width() <= 0 || height() <= 0; }
};

// Scans inward from each edge while every channel of the full-length row/column
// is <= tolerance.
BorderBox detect_borders(const cv::Mat& bgr, int tolerance);

// True when the content box is smaller than (1 - threshold) of the frame
// in either dimension.
bool has_significant_borders(const BorderBox& box, int width, int height, float threshold);

enum class AspectClass {
    EXTRA_TALL,
    PORTRAIT,
    SQUARE,
    LANDSCAPE,
    EXTRA_WIDE
};

std::string aspect_class_to_string(AspectClass c);

// Nearest of the class midpoints 0.6, 0.9, 1.0, 1.75, 2.25 (width / height).
AspectClass classify_aspect_ratio(double aspect_ratio);

} // namespace image_collate::image
