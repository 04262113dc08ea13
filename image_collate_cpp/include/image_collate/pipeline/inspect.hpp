#pragma once

#include "image_collate/config/configuration.hpp"
#include "image_collate/core/types.hpp"
#include "image_collate/features/perceptual_hash.hpp"
#include "image_collate/io/image_codec.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace image_collate::pipeline {

// Size, content bounding box, aspect ratios and collation features of one
// image. Throws DecodeError when the image cannot be read.
nlohmann::json inspect_image(const fs::path& path, const config::Config& cfg,
                             const io::ImageCodec& codec,
                             const features::PerceptualHasher& hasher);

struct InspectReport {
    nlohmann::json images = nlohmann::json::array();
    int failed = 0;
    std::vector<std::string> failed_files;
};

nlohmann::json to_json(const InspectReport& r);

/**
 * Runs inspect_image over every image directly in input_dir. Each entry
 * also names its nearest neighbour in the directory by fingerprint
 * Hamming distance, which shows near-duplicates before a collation run.
 * Throws IOError when input_dir cannot be listed; unreadable images are
 * counted in the report.
 */
InspectReport inspect_directory(const fs::path& input_dir, const config::Config& cfg,
                                const io::ImageCodec& codec,
                                const features::PerceptualHasher& hasher, std::ostream& log);

} // namespace image_collate::pipeline
