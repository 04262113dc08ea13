#include "image_collate/io/texture_export.hpp"
#include "image_collate/core/utils.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

#include <sys/wait.h>

namespace image_collate::io {

CommandTextureExporter::CommandTextureExporter(std::string command_template)
    : command_template_(std::move(command_template)) {}

std::string CommandTextureExporter::build_command(const fs::path& raster,
                                                  const fs::path& output) const {
    std::string cmd = core::replace_all(command_template_, "{input}",
                                        core::shell_quote(raster.string()));
    return core::replace_all(cmd, "{output}", core::shell_quote(output.string()));
}

ExportResult CommandTextureExporter::export_texture(const fs::path& raster,
                                                    const fs::path& output) const {
    ExportResult result;
    if (!fs::exists(raster)) {
        result.error_message = "source raster missing: " + raster.string();
        return result;
    }

    const std::string cmd = build_command(raster, output);
    std::cerr << "[EXPORT] Running: " << cmd << std::endl;
    const int ret = std::system(cmd.c_str());

    if (ret == -1) {
        result.error_message = "cannot start converter: " + cmd;
        return result;
    }
    if (!WIFEXITED(ret)) {
        result.error_message = "converter terminated abnormally (wait status " +
                               std::to_string(ret) + ")";
        return result;
    }
    if (WEXITSTATUS(ret) != 0) {
        result.error_message =
            "converter exited with status " + std::to_string(WEXITSTATUS(ret));
        return result;
    }
    if (!fs::exists(output)) {
        result.error_message = "converter produced no output: " + output.string();
        return result;
    }

    result.success = true;
    return result;
}

} // namespace image_collate::io
