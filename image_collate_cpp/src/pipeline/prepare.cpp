#include "image_collate/pipeline/prepare.hpp"
#include "image_collate/core/errors.hpp"
#include "image_collate/core/utils.hpp"

namespace image_collate::pipeline {

nlohmann::json to_json(const PrepareSummary& s) {
    nlohmann::json j;
    j["processed"] = s.processed;
    j["cropped"] = s.cropped;
    j["failed"] = s.failed;
    j["failed_files"] = s.failed_files;
    j["per_class"] = s.per_class;
    return j;
}

PrepareSummary prepare_directory(const fs::path& input_dir, const fs::path& output_dir,
                                 const config::PrepareConfig& cfg, const io::ImageCodec& codec,
                                 std::ostream& log) {
    const auto files = core::list_images(input_dir, cfg.extensions);

    static const image::AspectClass kAll[] = {
        image::AspectClass::EXTRA_TALL, image::AspectClass::PORTRAIT, image::AspectClass::SQUARE,
        image::AspectClass::LANDSCAPE, image::AspectClass::EXTRA_WIDE};

    std::error_code ec;
    for (auto c : kAll) {
        fs::create_directories(output_dir / image::aspect_class_to_string(c), ec);
        if (ec) {
            throw IOError("cannot create " + (output_dir / image::aspect_class_to_string(c)).string() +
                          ": " + ec.message());
        }
    }

    PrepareSummary summary;
    log << "[PREPARE] " << files.size() << " images in " << input_dir.string() << std::endl;

    for (const auto& path : files) {
        const std::string name = path.filename().string();
        try {
            cv::Mat img = codec.decode(path);
            const image::BorderBox box = image::detect_borders(img, cfg.border_tolerance);

            cv::Mat out = img;
            if (image::has_significant_borders(box, img.cols, img.rows, cfg.border_threshold)) {
                out = img(cv::Rect(box.left, box.top, box.width(), box.height())).clone();
                ++summary.cropped;
            }

            const double ratio = static_cast<double>(out.cols) / static_cast<double>(out.rows);
            const std::string cls =
                image::aspect_class_to_string(image::classify_aspect_ratio(ratio));

            codec.save(output_dir / cls / name, out);
            ++summary.processed;
            ++summary.per_class[cls];
            log << "[PREPARE] " << name << " -> " << cls << " (" << out.cols << "x" << out.rows
                << ")" << std::endl;
        } catch (const ImageCollateError& e) {
            ++summary.failed;
            summary.failed_files.push_back(name);
            log << "[PREPARE] Error: " << name << ": " << e.what() << std::endl;
        }
    }

    log << "[PREPARE] processed=" << summary.processed << " cropped=" << summary.cropped
        << " failed=" << summary.failed << std::endl;
    return summary;
}

} // namespace image_collate::pipeline
