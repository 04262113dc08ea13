#pragma once

#include "image_collate/config/configuration.hpp"
#include "image_collate/core/types.hpp"
#include "image_collate/image/processing.hpp"
#include "image_collate/io/image_codec.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace image_collate::pipeline {

struct PrepareSummary {
    int processed = 0;
    int cropped = 0;
    int failed = 0;
    std::vector<std::string> failed_files;
    std::map<std::string, int> per_class;
};

nlohmann::json to_json(const PrepareSummary& s);

/**
 * Sorts a flat directory of raw images into aspect-ratio class folders
 * under output_dir, cropping uniform dark frames first.
 * Throws IOError when input_dir cannot be listed or output_dir created;
 * per-image failures are counted in the summary.
 */
PrepareSummary prepare_directory(const fs::path& input_dir, const fs::path& output_dir,
                                 const config::PrepareConfig& cfg, const io::ImageCodec& codec,
                                 std::ostream& log);

} // namespace image_collate::pipeline
