#include "image_collate/config/configuration.hpp"
#include "image_collate/core/errors.hpp"

#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using image_collate::config::Config;

TEST_CASE("config_defaults_are_valid") {
    Config cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.grid.spec().capacity() == 16);
    REQUIRE(cfg.features.white_threshold == 240);
    REQUIRE(cfg.features.black_threshold == 30);
    REQUIRE(cfg.input.root_subcategory_label == "main");
    REQUIRE(cfg.ledger.path == "stitched_images_log.csv");
    REQUIRE_FALSE(cfg.texture_export.enabled);
}

TEST_CASE("config_from_yaml_overrides_only_given_keys") {
    YAML::Node node = YAML::Load(R"(
grid:
  rows: 2
  cols: 3
  cell_width: 64
features:
  white_threshold: 250
preprocess:
  autocontrast: true
  sharpness: 1.5
input:
  extensions: [".png"]
texture_export:
  enabled: true
  command: "texconv -o {output} {input}"
)");
    Config cfg = Config::from_yaml(node);
    REQUIRE(cfg.grid.rows == 2);
    REQUIRE(cfg.grid.cols == 3);
    REQUIRE(cfg.grid.cell_width == 64);
    REQUIRE(cfg.grid.cell_height == 512);
    REQUIRE(cfg.features.white_threshold == 250);
    REQUIRE(cfg.features.black_threshold == 30);
    REQUIRE(cfg.preprocess.autocontrast);
    REQUIRE(cfg.preprocess.sharpness == Catch::Approx(1.5f));
    REQUIRE(cfg.input.extensions == std::vector<std::string>{".png"});
    REQUIRE(cfg.texture_export.enabled);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_validate_rejects_bad_values") {
    {
        Config cfg;
        cfg.grid.rows = 0;
        REQUIRE_THROWS_AS(cfg.validate(), image_collate::ValidationError);
    }
    {
        Config cfg;
        cfg.features.black_threshold = 240;
        REQUIRE_THROWS_AS(cfg.validate(), image_collate::ValidationError);
    }
    {
        Config cfg;
        cfg.features.white_threshold = 300;
        REQUIRE_THROWS_AS(cfg.validate(), image_collate::ValidationError);
    }
    {
        Config cfg;
        cfg.preprocess.sharpness = -0.5f;
        REQUIRE_THROWS_AS(cfg.validate(), image_collate::ValidationError);
    }
    {
        Config cfg;
        cfg.input.extensions.clear();
        REQUIRE_THROWS_AS(cfg.validate(), image_collate::ValidationError);
    }
    {
        Config cfg;
        cfg.texture_export.enabled = true;
        cfg.texture_export.command = "convert in.png out.dds";
        REQUIRE_THROWS_AS(cfg.validate(), image_collate::ValidationError);
    }
    {
        Config cfg;
        cfg.features.hash_size = 9;
        REQUIRE_THROWS_AS(cfg.validate(), image_collate::ValidationError);
    }
}

TEST_CASE("config_save_and_load_preserve_values") {
    image_collate::testing::TempDir tmp("config");
    Config cfg;
    cfg.grid.rows = 3;
    cfg.runtime.parallel_workers = 2;
    cfg.input.root_subcategory_label = "root";
    cfg.save(tmp.path() / "c.yaml");

    Config loaded = Config::load(tmp.path() / "c.yaml");
    REQUIRE(loaded.grid.rows == 3);
    REQUIRE(loaded.runtime.parallel_workers == 2);
    REQUIRE(loaded.input.root_subcategory_label == "root");
    REQUIRE(loaded.input.extensions == cfg.input.extensions);
}

TEST_CASE("config_load_reports_missing_and_malformed_files") {
    image_collate::testing::TempDir tmp("config_bad");
    REQUIRE_THROWS_AS(Config::load(tmp.path() / "nope.yaml"), image_collate::ConfigError);

    {
        std::ofstream out(tmp.path() / "bad.yaml");
        out << "grid: [unterminated\n";
    }
    REQUIRE_THROWS_AS(Config::load(tmp.path() / "bad.yaml"), image_collate::ConfigError);
}

TEST_CASE("config_schema_is_json") {
    auto schema = nlohmann::json::parse(image_collate::config::get_schema_json());
    REQUIRE(schema["type"] == "object");
    REQUIRE(schema["properties"].contains("grid"));
}
