#pragma once

#include "image_collate/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace image_collate::config {

namespace fs = std::filesystem;

struct GridConfig {
  int rows = 4;
  int cols = 4;
  int cell_width = 512;
  int cell_height = 512;

  GridSpec spec() const { return GridSpec{rows, cols, cell_width, cell_height}; }
};

struct FeaturesConfig {
  int white_threshold = 240;     // all channels >= threshold counts as white
  int black_threshold = 30;      // all channels <= threshold counts as black
  int dominant_color_sample = 50; // area-resize edge before averaging
  int hash_size = 8;             // DCT low-frequency block edge
  int hash_highfreq_factor = 4;  // hash input edge = hash_size * factor
};

struct PreprocessConfig {
  bool autocontrast = false;
  float sharpness = 1.0f; // 1.0 = unchanged, >1 sharpens, <1 blurs
};

struct InputConfig {
  std::vector<std::string> extensions{".png", ".jpg", ".jpeg"};
  std::string root_subcategory_label = "main";
};

struct OutputConfig {
  std::string raster_extension = ".png";
  std::string logs_dir = "logs";
  bool write_summary_json = true;
};

struct LedgerConfig {
  std::string path = "stitched_images_log.csv"; // relative to the output dir
};

struct TextureExportConfig {
  bool enabled = false;
  std::string extension = ".dds";
  std::string command = "convert {input} {output}";
};

struct PrepareConfig {
  int border_tolerance = 5;
  float border_threshold = 0.05f; // crop when borders exceed this fraction
  std::vector<std::string> extensions{".png", ".jpg", ".jpeg", ".bmp", ".tiff"};
};

struct RuntimeConfig {
  int parallel_workers = 0; // 0 = host parallelism
};

struct Config {
  GridConfig grid;
  FeaturesConfig features;
  PreprocessConfig preprocess;
  InputConfig input;
  OutputConfig output;
  LedgerConfig ledger;
  TextureExportConfig texture_export;
  PrepareConfig prepare;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace image_collate::config
