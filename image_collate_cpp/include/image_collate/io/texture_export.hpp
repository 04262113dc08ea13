#pragma once

#include "image_collate/core/types.hpp"

#include <string>

namespace image_collate::io {

struct ExportResult {
    bool success = false;
    std::string error_message;
};

/**
 * Converts a saved raster into a secondary texture format.
 * Failures are reported through ExportResult, never thrown.
 */
class TextureExporter {
public:
    virtual ~TextureExporter() = default;

    virtual ExportResult export_texture(const fs::path& raster, const fs::path& output) const = 0;
};

/**
 * Runs an external converter. The command template must contain the
 * {input} and {output} placeholders, which are replaced by shell-quoted paths.
 */
class CommandTextureExporter : public TextureExporter {
public:
    explicit CommandTextureExporter(std::string command_template);

    ExportResult export_texture(const fs::path& raster, const fs::path& output) const override;

    std::string build_command(const fs::path& raster, const fs::path& output) const;

private:
    std::string command_template_;
};

} // namespace image_collate::io
