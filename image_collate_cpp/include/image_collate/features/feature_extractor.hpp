#pragma once

#include "image_collate/core/types.hpp"
#include "image_collate/features/perceptual_hash.hpp"
#include "image_collate/io/image_codec.hpp"

#include <opencv2/core.hpp>

namespace image_collate::features {

struct FeatureParams {
    int white_threshold = 240;
    int black_threshold = 30;
    int dominant_color_sample = 50;
    bool autocontrast = false;
    float sharpness = 1.0f;
};

// Fraction of pixels whose channels are all >= threshold.
double compute_whiteness(const cv::Mat& bgr, int threshold);

// Fraction of pixels whose channels are all <= threshold.
double compute_blackness(const cv::Mat& bgr, int threshold);

// Mean color after area-resampling to sample x sample, in R,G,B order.
Color3d compute_dominant_color(const cv::Mat& bgr, int sample);

class FeatureExtractor {
public:
    FeatureExtractor(const io::ImageCodec& codec, const PerceptualHasher& hasher,
                     GridSpec grid, FeatureParams params);

    // Decodes, resizes to the cell resolution and computes all features.
    // Throws DecodeError (or another IOError) on failure.
    ImageRecord extract(const fs::path& path) const;

    // Feature computation on already-decoded pixels.
    ImageRecord extract_from(const std::string& filename, const cv::Mat& decoded) const;

private:
    const io::ImageCodec& codec_;
    const PerceptualHasher& hasher_;
    GridSpec grid_;
    FeatureParams params_;
};

} // namespace image_collate::features
