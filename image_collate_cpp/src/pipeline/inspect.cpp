#include "image_collate/pipeline/inspect.hpp"
#include "image_collate/core/errors.hpp"
#include "image_collate/core/utils.hpp"
#include "image_collate/features/feature_extractor.hpp"
#include "image_collate/image/processing.hpp"

namespace image_collate::pipeline {

nlohmann::json inspect_image(const fs::path& path, const config::Config& cfg,
                             const io::ImageCodec& codec,
                             const features::PerceptualHasher& hasher) {
    const cv::Mat img = codec.decode(path);
    const image::BorderBox box = image::detect_borders(img, cfg.prepare.border_tolerance);

    const double ratio = static_cast<double>(img.cols) / static_cast<double>(img.rows);
    const double bbox_ratio = static_cast<double>(box.width()) / static_cast<double>(box.height());

    features::FeatureParams params;
    params.white_threshold = cfg.features.white_threshold;
    params.black_threshold = cfg.features.black_threshold;
    params.dominant_color_sample = cfg.features.dominant_color_sample;
    params.autocontrast = cfg.preprocess.autocontrast;
    params.sharpness = cfg.preprocess.sharpness;
    features::FeatureExtractor extractor(codec, hasher, cfg.grid.spec(), params);
    const ImageRecord rec = extractor.extract_from(path.filename().string(), img);

    nlohmann::json j;
    j["path"] = path.string();
    j["width"] = img.cols;
    j["height"] = img.rows;
    j["aspect_ratio"] = ratio;
    j["bbox"] = {{"left", box.left}, {"top", box.top}, {"right", box.right}, {"bottom", box.bottom}};
    j["bbox_aspect_ratio"] = bbox_ratio;
    j["significant_borders"] =
        image::has_significant_borders(box, img.cols, img.rows, cfg.prepare.border_threshold);
    j["aspect_class"] = image::aspect_class_to_string(image::classify_aspect_ratio(bbox_ratio));
    j["features"] = {
        {"fingerprint", rec.fingerprint.to_hex()},
        {"dominant_color", {rec.dominant_color.x(), rec.dominant_color.y(), rec.dominant_color.z()}},
        {"whiteness", rec.whiteness},
        {"blackness", rec.blackness},
    };
    return j;
}

nlohmann::json to_json(const InspectReport& r) {
    nlohmann::json j;
    j["images"] = r.images;
    j["failed"] = r.failed;
    j["failed_files"] = r.failed_files;
    return j;
}

InspectReport inspect_directory(const fs::path& input_dir, const config::Config& cfg,
                                const io::ImageCodec& codec,
                                const features::PerceptualHasher& hasher, std::ostream& log) {
    const auto files = core::list_images(input_dir, cfg.input.extensions);
    log << "[INSPECT] " << files.size() << " images in " << input_dir.string() << std::endl;

    InspectReport report;
    std::vector<Fingerprint> fps;
    for (const auto& path : files) {
        const std::string name = path.filename().string();
        try {
            nlohmann::json entry = inspect_image(path, cfg, codec, hasher);
            entry["filename"] = name;
            const auto fp = Fingerprint::from_hex(entry["features"]["fingerprint"].get<std::string>());
            fps.push_back(fp.value_or(Fingerprint{}));
            report.images.push_back(std::move(entry));
        } catch (const ImageCollateError& e) {
            ++report.failed;
            report.failed_files.push_back(name);
            log << "[INSPECT] Error: " << name << ": " << e.what() << std::endl;
        }
    }

    for (size_t i = 0; i < fps.size(); ++i) {
        int best = -1;
        size_t best_idx = 0;
        for (size_t k = 0; k < fps.size(); ++k) {
            if (k == i) continue;
            const int d = fps[i].hamming_distance(fps[k]);
            if (best < 0 || d < best) {
                best = d;
                best_idx = k;
            }
        }
        if (best >= 0) {
            report.images[i]["nearest"] = {{"filename", report.images[best_idx]["filename"]},
                                           {"hamming_distance", best}};
        }
    }

    log << "[INSPECT] inspected=" << report.images.size() << " failed=" << report.failed
        << std::endl;
    return report;
}

} // namespace image_collate::pipeline
