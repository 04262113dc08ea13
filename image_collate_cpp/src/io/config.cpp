#include "image_collate/config/configuration.hpp"
#include "image_collate/core/errors.hpp"

#include <fstream>
#include <sstream>

namespace image_collate::config {

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    }
}

static bool is_extension(const std::string& ext) {
    return ext.size() >= 2 && ext[0] == '.';
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["grid"]) {
        auto g = node["grid"];
        if (g["rows"]) cfg.grid.rows = g["rows"].as<int>();
        if (g["cols"]) cfg.grid.cols = g["cols"].as<int>();
        if (g["cell_width"]) cfg.grid.cell_width = g["cell_width"].as<int>();
        if (g["cell_height"]) cfg.grid.cell_height = g["cell_height"].as<int>();
    }

    if (node["features"]) {
        auto f = node["features"];
        if (f["white_threshold"]) cfg.features.white_threshold = f["white_threshold"].as<int>();
        if (f["black_threshold"]) cfg.features.black_threshold = f["black_threshold"].as<int>();
        if (f["dominant_color_sample"]) {
            cfg.features.dominant_color_sample = f["dominant_color_sample"].as<int>();
        }
        if (f["hash_size"]) cfg.features.hash_size = f["hash_size"].as<int>();
        if (f["hash_highfreq_factor"]) {
            cfg.features.hash_highfreq_factor = f["hash_highfreq_factor"].as<int>();
        }
    }

    if (node["preprocess"]) {
        auto p = node["preprocess"];
        if (p["autocontrast"]) cfg.preprocess.autocontrast = p["autocontrast"].as<bool>();
        if (p["sharpness"]) cfg.preprocess.sharpness = p["sharpness"].as<float>();
    }

    if (node["input"]) {
        auto i = node["input"];
        read_string_list(i["extensions"], cfg.input.extensions);
        if (i["root_subcategory_label"]) {
            cfg.input.root_subcategory_label = i["root_subcategory_label"].as<std::string>();
        }
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["raster_extension"]) cfg.output.raster_extension = o["raster_extension"].as<std::string>();
        if (o["logs_dir"]) cfg.output.logs_dir = o["logs_dir"].as<std::string>();
        if (o["write_summary_json"]) cfg.output.write_summary_json = o["write_summary_json"].as<bool>();
    }

    if (node["ledger"]) {
        auto l = node["ledger"];
        if (l["path"]) cfg.ledger.path = l["path"].as<std::string>();
    }

    if (node["texture_export"]) {
        auto t = node["texture_export"];
        if (t["enabled"]) cfg.texture_export.enabled = t["enabled"].as<bool>();
        if (t["extension"]) cfg.texture_export.extension = t["extension"].as<std::string>();
        if (t["command"]) cfg.texture_export.command = t["command"].as<std::string>();
    }

    if (node["prepare"]) {
        auto p = node["prepare"];
        if (p["border_tolerance"]) cfg.prepare.border_tolerance = p["border_tolerance"].as<int>();
        if (p["border_threshold"]) cfg.prepare.border_threshold = p["border_threshold"].as<float>();
        read_string_list(p["extensions"], cfg.prepare.extensions);
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot write config: " + path.string());
    }
    out << to_yaml() << "\n";
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["grid"]["rows"] = grid.rows;
    node["grid"]["cols"] = grid.cols;
    node["grid"]["cell_width"] = grid.cell_width;
    node["grid"]["cell_height"] = grid.cell_height;

    node["features"]["white_threshold"] = features.white_threshold;
    node["features"]["black_threshold"] = features.black_threshold;
    node["features"]["dominant_color_sample"] = features.dominant_color_sample;
    node["features"]["hash_size"] = features.hash_size;
    node["features"]["hash_highfreq_factor"] = features.hash_highfreq_factor;

    node["preprocess"]["autocontrast"] = preprocess.autocontrast;
    node["preprocess"]["sharpness"] = preprocess.sharpness;

    for (const auto& ext : input.extensions) {
        node["input"]["extensions"].push_back(ext);
    }
    node["input"]["root_subcategory_label"] = input.root_subcategory_label;

    node["output"]["raster_extension"] = output.raster_extension;
    node["output"]["logs_dir"] = output.logs_dir;
    node["output"]["write_summary_json"] = output.write_summary_json;

    node["ledger"]["path"] = ledger.path;

    node["texture_export"]["enabled"] = texture_export.enabled;
    node["texture_export"]["extension"] = texture_export.extension;
    node["texture_export"]["command"] = texture_export.command;

    node["prepare"]["border_tolerance"] = prepare.border_tolerance;
    node["prepare"]["border_threshold"] = prepare.border_threshold;
    for (const auto& ext : prepare.extensions) {
        node["prepare"]["extensions"].push_back(ext);
    }

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    return node;
}

void Config::validate() const {
    if (grid.rows < 1 || grid.cols < 1) {
        throw ValidationError("grid.rows and grid.cols must be >= 1");
    }
    if (grid.cell_width < 1 || grid.cell_height < 1) {
        throw ValidationError("grid.cell_width and grid.cell_height must be >= 1");
    }

    if (features.white_threshold < 0 || features.white_threshold > 255) {
        throw ValidationError("features.white_threshold must be in [0,255]");
    }
    if (features.black_threshold < 0 || features.black_threshold > 255) {
        throw ValidationError("features.black_threshold must be in [0,255]");
    }
    if (features.black_threshold >= features.white_threshold) {
        throw ValidationError("features.black_threshold must be < features.white_threshold");
    }
    if (features.dominant_color_sample < 1) {
        throw ValidationError("features.dominant_color_sample must be >= 1");
    }
    if (features.hash_size < 2 || features.hash_size > 8) {
        throw ValidationError("features.hash_size must be in [2,8] (fingerprints are 64 bits)");
    }
    if (features.hash_highfreq_factor < 1) {
        throw ValidationError("features.hash_highfreq_factor must be >= 1");
    }
    if ((features.hash_size * features.hash_highfreq_factor) % 2 != 0) {
        throw ValidationError("features.hash_size * features.hash_highfreq_factor must be even");
    }

    if (preprocess.sharpness < 0.0f) {
        throw ValidationError("preprocess.sharpness must be >= 0");
    }

    if (input.extensions.empty()) {
        throw ValidationError("input.extensions must not be empty");
    }
    for (const auto& ext : input.extensions) {
        if (!is_extension(ext)) {
            throw ValidationError("input.extensions entries must start with '.': " + ext);
        }
    }
    if (input.root_subcategory_label.empty()) {
        throw ValidationError("input.root_subcategory_label must not be empty");
    }

    if (!is_extension(output.raster_extension)) {
        throw ValidationError("output.raster_extension must start with '.'");
    }
    if (output.logs_dir.empty()) {
        throw ValidationError("output.logs_dir must not be empty");
    }

    if (ledger.path.empty()) {
        throw ValidationError("ledger.path must not be empty");
    }

    if (texture_export.enabled) {
        if (!is_extension(texture_export.extension)) {
            throw ValidationError("texture_export.extension must start with '.'");
        }
        if (texture_export.extension == output.raster_extension) {
            throw ValidationError("texture_export.extension must differ from output.raster_extension");
        }
        if (texture_export.command.find("{input}") == std::string::npos ||
            texture_export.command.find("{output}") == std::string::npos) {
            throw ValidationError("texture_export.command must contain {input} and {output}");
        }
    }

    if (prepare.border_tolerance < 0 || prepare.border_tolerance > 255) {
        throw ValidationError("prepare.border_tolerance must be in [0,255]");
    }
    if (prepare.border_threshold < 0.0f || prepare.border_threshold >= 1.0f) {
        throw ValidationError("prepare.border_threshold must be in [0,1)");
    }
    if (prepare.extensions.empty()) {
        throw ValidationError("prepare.extensions must not be empty");
    }

    if (runtime.parallel_workers < 0 || runtime.parallel_workers > 256) {
        throw ValidationError("runtime.parallel_workers must be in [0,256]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "grid": {
      "type": "object",
      "properties": {
        "rows": {"type": "integer", "minimum": 1},
        "cols": {"type": "integer", "minimum": 1},
        "cell_width": {"type": "integer", "minimum": 1},
        "cell_height": {"type": "integer", "minimum": 1}
      }
    },
    "features": {
      "type": "object",
      "properties": {
        "white_threshold": {"type": "integer", "minimum": 0, "maximum": 255},
        "black_threshold": {"type": "integer", "minimum": 0, "maximum": 255},
        "dominant_color_sample": {"type": "integer", "minimum": 1},
        "hash_size": {"type": "integer", "minimum": 2, "maximum": 8},
        "hash_highfreq_factor": {"type": "integer", "minimum": 1}
      }
    },
    "preprocess": {
      "type": "object",
      "properties": {
        "autocontrast": {"type": "boolean"},
        "sharpness": {"type": "number", "minimum": 0}
      }
    },
    "input": {
      "type": "object",
      "properties": {
        "extensions": {"type": "array", "items": {"type": "string"}, "minItems": 1},
        "root_subcategory_label": {"type": "string", "minLength": 1}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "raster_extension": {"type": "string"},
        "logs_dir": {"type": "string"},
        "write_summary_json": {"type": "boolean"}
      }
    },
    "ledger": {
      "type": "object",
      "properties": {
        "path": {"type": "string", "minLength": 1}
      }
    },
    "texture_export": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "extension": {"type": "string"},
        "command": {"type": "string"}
      }
    },
    "prepare": {
      "type": "object",
      "properties": {
        "border_tolerance": {"type": "integer", "minimum": 0, "maximum": 255},
        "border_threshold": {"type": "number", "minimum": 0, "exclusiveMaximum": 1},
        "extensions": {"type": "array", "items": {"type": "string"}, "minItems": 1}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 0, "maximum": 256}
      }
    }
  }
})";
}

} // namespace image_collate::config
