#include "image_collate/io/texture_export.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace image_collate;

TEST_CASE("texture_command_substitutes_quoted_paths") {
    io::CommandTextureExporter exporter("texconv -o {output} {input}");
    const std::string cmd = exporter.build_command("/tmp/a b.png", "/tmp/it's.dds");
    REQUIRE(cmd == "texconv -o '/tmp/it'\\''s.dds' '/tmp/a b.png'");
}

TEST_CASE("texture_export_runs_command_and_checks_output") {
    testing::TempDir tmp("texture");
    const fs::path raster = tmp.path() / "grid.png";
    testing::write_fake_image(raster, 1);

    io::CommandTextureExporter copier("cp {input} {output}");
    const auto ok = copier.export_texture(raster, tmp.path() / "grid.dds");
    REQUIRE(ok.success);
    REQUIRE(fs::exists(tmp.path() / "grid.dds"));

    io::CommandTextureExporter failing("false {input} {output}");
    const auto failed = failing.export_texture(raster, tmp.path() / "other.dds");
    REQUIRE_FALSE(failed.success);
    REQUIRE(failed.error_message == "converter exited with status 1");

    io::CommandTextureExporter exit3("sh -c 'exit 3' {input} {output}");
    const auto three = exit3.export_texture(raster, tmp.path() / "three.dds");
    REQUIRE(three.error_message == "converter exited with status 3");

    const auto missing = copier.export_texture(tmp.path() / "nope.png", tmp.path() / "x.dds");
    REQUIRE_FALSE(missing.success);
}
