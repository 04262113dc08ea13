#include "image_collate/features/perceptual_hash.hpp"
#include "image_collate/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace image_collate::features {

DctHasher::DctHasher(int hash_size, int highfreq_factor)
    : hash_size_(hash_size), highfreq_factor_(highfreq_factor) {
    if (hash_size_ < 2 || hash_size_ > 8 || highfreq_factor_ < 1 ||
        ((hash_size_ * highfreq_factor_) % 2) != 0) {
        throw ValidationError("invalid DCT hash geometry");
    }
}

Fingerprint DctHasher::hash(const cv::Mat& bgr) const {
    if (bgr.empty()) {
        throw DecodeError("cannot hash empty image");
    }

    const int n = hash_size_ * highfreq_factor_;

    cv::Mat gray;
    if (bgr.channels() == 1) {
        gray = bgr;
    } else {
        cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    }

    cv::Mat small;
    cv::resize(gray, small, cv::Size(n, n), 0.0, 0.0, cv::INTER_AREA);

    cv::Mat pixels;
    small.convertTo(pixels, CV_64F);

    cv::Mat coeffs;
    cv::dct(pixels, coeffs);

    // cv::dct is orthonormal; rescale to the unnormalized DCT-II so the
    // DC row/column compare against the median on the same footing.
    const double f0 = std::sqrt(1.0 / (4.0 * n));
    const double fk = std::sqrt(1.0 / (2.0 * n));

    std::vector<double> low;
    low.reserve(static_cast<size_t>(hash_size_ * hash_size_));
    for (int y = 0; y < hash_size_; ++y) {
        for (int x = 0; x < hash_size_; ++x) {
            const double fy = (y == 0) ? f0 : fk;
            const double fx = (x == 0) ? f0 : fk;
            low.push_back(coeffs.at<double>(y, x) / (fy * fx));
        }
    }

    std::vector<double> sorted = low;
    std::sort(sorted.begin(), sorted.end());
    const size_t m = sorted.size();
    const double median = (m % 2 == 1) ? sorted[m / 2]
                                       : 0.5 * (sorted[m / 2 - 1] + sorted[m / 2]);

    Fingerprint fp;
    for (double c : low) {
        fp.bits = (fp.bits << 1) | (c > median ? 1u : 0u);
    }
    return fp;
}

} // namespace image_collate::features
