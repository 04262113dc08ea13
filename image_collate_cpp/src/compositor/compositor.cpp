#include "image_collate/compositor/compositor.hpp"
#include "image_collate/core/errors.hpp"
#include "image_collate/core/utils.hpp"

#include <utility>

namespace image_collate::compositor {

cv::Mat compose_grid(const std::vector<cv::Mat>& tiles, const GridSpec& grid) {
    if (static_cast<int>(tiles.size()) != grid.capacity()) {
        throw ValidationError("expected " + std::to_string(grid.capacity()) + " tiles, got " +
                              std::to_string(tiles.size()));
    }

    cv::Mat canvas(grid.rows * grid.cell_height, grid.cols * grid.cell_width, CV_8UC3,
                   cv::Scalar(0, 0, 0));

    for (size_t i = 0; i < tiles.size(); ++i) {
        const cv::Mat& tile = tiles[i];
        if (tile.cols != grid.cell_width || tile.rows != grid.cell_height ||
            tile.type() != CV_8UC3) {
            throw ValidationError("tile " + std::to_string(i) + " is " +
                                  std::to_string(tile.cols) + "x" + std::to_string(tile.rows) +
                                  ", expected " + std::to_string(grid.cell_width) + "x" +
                                  std::to_string(grid.cell_height) + " BGR");
        }
        const int r = static_cast<int>(i) / grid.cols;
        const int c = static_cast<int>(i) % grid.cols;
        cv::Rect roi(c * grid.cell_width, r * grid.cell_height, grid.cell_width, grid.cell_height);
        tile.copyTo(canvas(roi));
    }
    return canvas;
}

std::string batch_stem(const std::string& category, const std::string& label, int batch_number) {
    return category + "-" + label + "-" + std::to_string(batch_number);
}

Compositor::Compositor(const io::ImageCodec& codec, GridSpec grid, fs::path output_dir,
                       std::string raster_extension, const io::TextureExporter* exporter,
                       std::string texture_extension)
    : codec_(codec),
      grid_(grid),
      output_dir_(std::move(output_dir)),
      raster_extension_(std::move(raster_extension)),
      exporter_(exporter),
      texture_extension_(std::move(texture_extension)) {}

RenderResult Compositor::render(std::vector<ImageRecord>& batch, const std::string& category,
                                const std::string& label, int batch_number) const {
    std::vector<cv::Mat> tiles;
    tiles.reserve(batch.size());
    for (const auto& rec : batch) {
        tiles.push_back(rec.pixels);
    }

    cv::Mat canvas = compose_grid(tiles, grid_);
    tiles.clear();
    for (auto& rec : batch) {
        rec.pixels.release();
    }

    const std::string stem = batch_stem(category, label, batch_number);

    RenderResult result;
    result.primary_path = output_dir_ / (stem + raster_extension_);
    codec_.save(result.primary_path, canvas);
    canvas.release();
    result.primary_sha256 = core::sha256_file(result.primary_path);

    if (exporter_ != nullptr) {
        const fs::path secondary = output_dir_ / (stem + texture_extension_);
        io::ExportResult ex = exporter_->export_texture(result.primary_path, secondary);
        if (ex.success) {
            result.secondary_path = secondary;
        } else {
            result.secondary_error = ex.error_message;
        }
    }

    return result;
}

} // namespace image_collate::compositor
