#include "runner_shared.hpp"

#include "image_collate/config/configuration.hpp"
#include "image_collate/core/errors.hpp"
#include "image_collate/core/events.hpp"
#include "image_collate/core/utils.hpp"
#include "image_collate/features/perceptual_hash.hpp"
#include "image_collate/io/image_codec.hpp"
#include "image_collate/io/texture_export.hpp"
#include "image_collate/ledger/duplicate_ledger.hpp"
#include "image_collate/pipeline/inspect.hpp"
#include "image_collate/pipeline/orchestrator.hpp"
#include "image_collate/pipeline/prepare.hpp"
#include "image_collate/report/summary.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
namespace ic = image_collate;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static ic::config::Config load_config_or_default(const std::string& path) {
    ic::config::Config cfg = path.empty() ? ic::config::Config{} : ic::config::Config::load(path);
    cfg.validate();
    return cfg;
}

static int cmd_run(const std::string& config_path, const std::string& input_dir,
                   const std::string& output_dir, const std::string& ledger_arg,
                   const std::string& run_id_arg, bool dry_run) {
    ic::config::Config cfg;
    try {
        cfg = load_config_or_default(config_path);
    } catch (const ic::ImageCollateError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const fs::path out_dir(output_dir);
    const fs::path logs_dir = out_dir / cfg.output.logs_dir;
    const std::string run_id = run_id_arg.empty() ? ic::core::get_run_id() : run_id_arg;
    const fs::path ledger_path =
        ic::runner::resolve_ledger_path(ledger_arg, cfg.ledger.path, out_dir);

    // A dry run leaves the output tree untouched: events go to stdout only.
    std::ofstream event_log_file;
    if (!dry_run &&
        !ic::runner::open_run_logs(logs_dir, config_path, run_id, event_log_file, std::cerr)) {
        return 1;
    }
    ic::runner::TeeBuf tee_buf(std::cout.rdbuf(), dry_run ? nullptr : event_log_file.rdbuf());
    std::ostream log_file(&tee_buf);

    ic::core::EventEmitter emitter;
    emitter.run_start(run_id,
                      {{"input_dir", input_dir},
                       {"output_dir", output_dir},
                       {"ledger", ledger_path.string()},
                       {"dry_run", dry_run},
                       {"grid", {{"rows", cfg.grid.rows}, {"cols", cfg.grid.cols}}}},
                      log_file);

    ic::io::OpenCvImageCodec codec;
    ic::features::DctHasher hasher(cfg.features.hash_size, cfg.features.hash_highfreq_factor);
    ic::ledger::DuplicateLedger ledger(ledger_path);
    std::unique_ptr<ic::io::CommandTextureExporter> exporter;
    if (cfg.texture_export.enabled) {
        exporter = std::make_unique<ic::io::CommandTextureExporter>(cfg.texture_export.command);
    }

    ic::pipeline::Orchestrator orchestrator(cfg, codec, hasher, ledger, exporter.get(), emitter,
                                            log_file, std::cerr);

    ic::report::RunSummary summary;
    try {
        summary = orchestrator.run(input_dir, out_dir, run_id, dry_run);
    } catch (const ic::ImageCollateError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        emitter.error(run_id, e.what(), log_file);
        emitter.run_end(run_id, false, "error", {{"error", e.what()}}, log_file);
        return 1;
    }

    ic::report::print_report(summary, std::cerr);

    if (cfg.output.write_summary_json && !dry_run) {
        try {
            ic::core::write_text(ic::runner::summary_path(logs_dir, run_id),
                                 ic::report::to_json(summary).dump(2));
        } catch (const ic::IOError& e) {
            std::cerr << "Warning: " << e.what() << std::endl;
            emitter.warning(run_id, e.what(), log_file);
        }
    }

    emitter.run_end(run_id, summary.success, summary.success ? "ok" : "error",
                    {{"totals", ic::report::to_json(summary.totals())},
                     {"ledger_incomplete", summary.ledger_incomplete}},
                    log_file);
    return summary.success ? 0 : 1;
}

static int cmd_prepare(const std::string& config_path, const std::string& input_dir,
                       const std::string& output_dir) {
    try {
        const ic::config::Config cfg = load_config_or_default(config_path);
        ic::io::OpenCvImageCodec codec;
        const ic::pipeline::PrepareSummary summary =
            ic::pipeline::prepare_directory(input_dir, output_dir, cfg.prepare, codec, std::cerr);
        print_json(ic::pipeline::to_json(summary));
        return 0;
    } catch (const ic::ImageCollateError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

static int cmd_inspect(const std::string& config_path, const std::string& image_path) {
    try {
        const ic::config::Config cfg = load_config_or_default(config_path);
        ic::io::OpenCvImageCodec codec;
        ic::features::DctHasher hasher(cfg.features.hash_size, cfg.features.hash_highfreq_factor);
        print_json(ic::pipeline::inspect_image(image_path, cfg, codec, hasher));
        return 0;
    } catch (const ic::ImageCollateError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

static int cmd_inspect_dir(const std::string& config_path, const std::string& input_dir,
                           const std::string& output_path) {
    try {
        const ic::config::Config cfg = load_config_or_default(config_path);
        ic::io::OpenCvImageCodec codec;
        ic::features::DctHasher hasher(cfg.features.hash_size, cfg.features.hash_highfreq_factor);
        const ic::pipeline::InspectReport report =
            ic::pipeline::inspect_directory(input_dir, cfg, codec, hasher, std::cerr);
        const json j = ic::pipeline::to_json(report);
        if (output_path.empty()) {
            print_json(j);
        } else {
            ic::core::write_text(output_path, j.dump(2));
            std::cerr << "[INSPECT] Wrote " << output_path << std::endl;
        }
        return 0;
    } catch (const ic::ImageCollateError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

static int cmd_validate_config(const std::string& path) {
    json result;
    try {
        ic::config::Config::load(path).validate();
        result["valid"] = true;
    } catch (const ic::ImageCollateError& e) {
        result["valid"] = false;
        result["error"] = e.what();
    }
    print_json(result);
    return result["valid"].get<bool>() ? 0 : 1;
}

static void print_usage() {
    std::cerr << "Usage: image_collate_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  run --input-dir <dir> --output-dir <dir> [--config <yaml>]\n"
              << "      [--ledger <csv>] [--run-id <id>] [--dry-run]\n"
              << "                             Deduplicate, group and composite image grids\n"
              << "  prepare --input-dir <dir> --output-dir <dir> [--config <yaml>]\n"
              << "                             Crop dark borders and sort by aspect ratio\n"
              << "  inspect --image <file> [--config <yaml>]\n"
              << "                             Print size, borders and features as JSON\n"
              << "  inspect --input-dir <dir> [--output <json>] [--config <yaml>]\n"
              << "                             Inspect every image, with nearest fingerprints\n"
              << "  validate-config --path <yaml>\n"
              << "  schema                     Print the configuration JSON schema\n"
              << "  default-config             Print the default configuration as YAML\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    if (command == "run") {
        const std::string input_dir = get_arg("--input-dir");
        const std::string output_dir = get_arg("--output-dir");
        if (input_dir.empty() || output_dir.empty()) {
            std::cerr << "run requires --input-dir and --output-dir\n";
            return 1;
        }
        return cmd_run(get_arg("--config"), input_dir, output_dir, get_arg("--ledger"),
                       get_arg("--run-id"), has_flag("--dry-run"));
    }

    if (command == "prepare") {
        const std::string input_dir = get_arg("--input-dir");
        const std::string output_dir = get_arg("--output-dir");
        if (input_dir.empty() || output_dir.empty()) {
            std::cerr << "prepare requires --input-dir and --output-dir\n";
            return 1;
        }
        return cmd_prepare(get_arg("--config"), input_dir, output_dir);
    }

    if (command == "inspect") {
        const std::string image = get_arg("--image");
        const std::string input_dir = get_arg("--input-dir");
        if (!input_dir.empty()) {
            return cmd_inspect_dir(get_arg("--config"), input_dir, get_arg("--output"));
        }
        if (image.empty()) {
            std::cerr << "inspect requires --image or --input-dir\n";
            return 1;
        }
        return cmd_inspect(get_arg("--config"), image);
    }

    if (command == "validate-config") {
        const std::string path = get_arg("--path");
        if (path.empty()) {
            std::cerr << "validate-config requires --path\n";
            return 1;
        }
        return cmd_validate_config(path);
    }

    if (command == "schema") {
        std::cout << ic::config::get_schema_json() << std::endl;
        return 0;
    }

    if (command == "default-config") {
        YAML::Emitter out;
        out << ic::config::Config{}.to_yaml();
        std::cout << out.c_str() << std::endl;
        return 0;
    }

    print_usage();
    return 1;
}
