#pragma once

#include "image_collate/core/types.hpp"
#include "image_collate/io/image_codec.hpp"
#include "image_collate/io/texture_export.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace image_collate::compositor {

// Places tile i at cell (i / cols, i % cols). Every tile must already be at
// the cell resolution; throws ValidationError otherwise.
cv::Mat compose_grid(const std::vector<cv::Mat>& tiles, const GridSpec& grid);

// "{category}-{label}-{batch}"
std::string batch_stem(const std::string& category, const std::string& label, int batch_number);

struct RenderResult {
    fs::path primary_path;
    std::string primary_sha256;
    std::optional<fs::path> secondary_path;
    std::string secondary_error;
};

class Compositor {
public:
    Compositor(const io::ImageCodec& codec, GridSpec grid, fs::path output_dir,
               std::string raster_extension, const io::TextureExporter* exporter,
               std::string texture_extension);

    // Composites, saves the primary raster and attempts the secondary export.
    // Releases each record's pixels. Throws IOError/ValidationError when the
    // primary raster cannot be produced.
    RenderResult render(std::vector<ImageRecord>& batch, const std::string& category,
                        const std::string& label, int batch_number) const;

private:
    const io::ImageCodec& codec_;
    GridSpec grid_;
    fs::path output_dir_;
    std::string raster_extension_;
    const io::TextureExporter* exporter_;
    std::string texture_extension_;
};

} // namespace image_collate::compositor
