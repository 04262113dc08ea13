#pragma once

#include "image_collate/core/types.hpp"

#include <opencv2/core.hpp>

namespace image_collate::features {

class PerceptualHasher {
public:
    virtual ~PerceptualHasher() = default;

    // Must be deterministic for identical pixel input.
    virtual Fingerprint hash(const cv::Mat& bgr) const = 0;
};

/**
 * DCT perceptual hash.
 *
 * The image is reduced to grayscale at (hash_size * highfreq_factor)^2,
 * transformed with an unnormalized 2-D DCT-II, and the top-left
 * hash_size x hash_size block is thresholded against its median.
 * Bits are packed row-major, first coefficient in the most significant
 * position, so 8x8 hashes print as the familiar 16 hex digits.
 */
class DctHasher : public PerceptualHasher {
public:
    explicit DctHasher(int hash_size = 8, int highfreq_factor = 4);

    Fingerprint hash(const cv::Mat& bgr) const override;

    int hash_size() const { return hash_size_; }

private:
    int hash_size_;
    int highfreq_factor_;
};

} // namespace image_collate::features
