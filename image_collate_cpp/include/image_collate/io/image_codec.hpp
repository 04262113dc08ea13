#pragma once

#include "image_collate/core/types.hpp"

#include <opencv2/core.hpp>

namespace image_collate::io {

/**
 * Decode/encode and resampling primitives.
 * All images are 8-bit, 3-channel, BGR.
 */
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    // Throws DecodeError when the file cannot be read or decoded.
    virtual cv::Mat decode(const fs::path& path) const = 0;

    // Throws DecodeError when the image cannot be resampled.
    virtual cv::Mat resize(const cv::Mat& image, int width, int height) const = 0;

    // Throws IOError when the image cannot be encoded or written.
    virtual void save(const fs::path& path, const cv::Mat& image) const = 0;
};

class OpenCvImageCodec : public ImageCodec {
public:
    cv::Mat decode(const fs::path& path) const override;
    cv::Mat resize(const cv::Mat& image, int width, int height) const override;
    void save(const fs::path& path, const cv::Mat& image) const override;
};

} // namespace image_collate::io
