#include "image_collate/pipeline/orchestrator.hpp"
#include "image_collate/core/errors.hpp"
#include "image_collate/core/utils.hpp"
#include "image_collate/features/feature_extractor.hpp"
#include "image_collate/grouping/batch_grouper.hpp"

#include <algorithm>

namespace image_collate::pipeline {

namespace {

bool is_hidden(const fs::path& p) {
    const std::string name = p.filename().string();
    return !name.empty() && name[0] == '.';
}

bool same_directory(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    const bool eq = fs::equivalent(a, b, ec);
    return !ec && eq;
}

features::FeatureParams feature_params(const config::Config& cfg) {
    features::FeatureParams p;
    p.white_threshold = cfg.features.white_threshold;
    p.black_threshold = cfg.features.black_threshold;
    p.dominant_color_sample = cfg.features.dominant_color_sample;
    p.autocontrast = cfg.preprocess.autocontrast;
    p.sharpness = cfg.preprocess.sharpness;
    return p;
}

std::vector<Fingerprint> fingerprints_of(const std::vector<ImageRecord>& records) {
    std::vector<Fingerprint> fps;
    fps.reserve(records.size());
    for (const auto& r : records) fps.push_back(r.fingerprint);
    return fps;
}

} // namespace

std::vector<SubcategoryUnit> discover_units(const fs::path& category_dir,
                                            const std::string& category,
                                            const config::Config& cfg) {
    std::vector<SubcategoryUnit> units;

    std::vector<fs::path> subdirs;
    for (const auto& d : core::list_subdirectories(category_dir)) {
        if (!is_hidden(d)) subdirs.push_back(d);
    }

    std::string root_label = cfg.input.root_subcategory_label;
    for (const auto& d : subdirs) {
        if (d.filename().string() == root_label) {
            root_label += "_root";
            break;
        }
    }

    const auto root_images = core::list_images(category_dir, cfg.input.extensions);
    if (!root_images.empty() || subdirs.empty()) {
        units.push_back(SubcategoryUnit{category, std::nullopt, category_dir, root_label});
    }
    for (const auto& d : subdirs) {
        const std::string name = d.filename().string();
        units.push_back(SubcategoryUnit{category, name, d, name});
    }
    return units;
}

Orchestrator::Orchestrator(const config::Config& cfg, const io::ImageCodec& codec,
                           const features::PerceptualHasher& hasher,
                           ledger::DuplicateLedger& ledger, const io::TextureExporter* exporter,
                           core::EventEmitter& emitter, std::ostream& event_out,
                           std::ostream& log)
    : cfg_(cfg),
      codec_(codec),
      hasher_(hasher),
      ledger_(ledger),
      exporter_(exporter),
      emitter_(emitter),
      event_out_(event_out),
      log_(log) {}

report::RunSummary Orchestrator::run(const fs::path& input_dir, const fs::path& output_dir,
                                     const std::string& run_id, bool dry_run) {
    report::RunSummary summary;
    summary.run_id = run_id;
    summary.dry_run = dry_run;
    run_id_ = run_id;
    dry_run_ = dry_run;

    std::error_code ec;
    if (!fs::is_directory(input_dir, ec)) {
        throw IOError("input directory not found: " + input_dir.string());
    }

    // LEDGER_LOAD
    emitter_.phase_start(run_id_, Phase::LEDGER_LOAD, "", event_out_);
    try {
        ledger_.load();
    } catch (const LedgerError& e) {
        emitter_.phase_end(run_id_, Phase::LEDGER_LOAD, "error", {{"error", e.what()}},
                           event_out_);
        throw;
    }
    log_ << "[LEDGER] " << ledger_.size() << " fingerprints loaded from "
         << ledger_.path().string() << std::endl;
    emitter_.phase_end(run_id_, Phase::LEDGER_LOAD, "ok",
                       {{"entries", ledger_.size()}, {"path", ledger_.path().string()}},
                       event_out_);

    // DISCOVER
    emitter_.phase_start(run_id_, Phase::DISCOVER, "", event_out_);
    std::vector<fs::path> categories;
    for (const auto& d : core::list_subdirectories(input_dir)) {
        if (is_hidden(d)) continue;
        if (same_directory(d, output_dir)) {
            log_ << "[DISCOVER] Skipping output directory " << d.string() << std::endl;
            continue;
        }
        categories.push_back(d);
    }
    log_ << "[DISCOVER] " << categories.size() << " categories under " << input_dir.string()
         << std::endl;
    emitter_.phase_end(run_id_, Phase::DISCOVER, "ok", {{"categories", categories.size()}},
                       event_out_);

    if (!dry_run_) {
        fs::create_directories(output_dir, ec);
        if (ec) {
            throw IOError("cannot create output directory " + output_dir.string() + ": " +
                          ec.message());
        }
    }

    const GridSpec grid = cfg_.grid.spec();
    features::FeatureExtractor extractor(codec_, hasher_, grid, feature_params(cfg_));
    const int workers = compute_worker_count(cfg_.runtime.parallel_workers,
                                             static_cast<size_t>(grid.capacity()));
    ExtractionPool pool(extractor, ledger_, workers, static_cast<size_t>(grid.capacity()) * 2);
    compositor::Compositor comp(codec_, grid, output_dir, cfg_.output.raster_extension,
                                exporter_, cfg_.texture_export.extension);
    pool_ = &pool;
    compositor_ = &comp;
    log_ << "[EXTRACT] " << pool.worker_count() << " workers, grid " << grid.rows << "x"
         << grid.cols << std::endl;

    for (const auto& cat_dir : categories) {
        summary.categories.emplace_back();
        report::CategorySummary& cs = summary.categories.back();
        cs.name = cat_dir.filename().string();
        try {
            process_category(cat_dir, cs.name, cs);
        } catch (const LedgerError& e) {
            summary.success = false;
            summary.ledger_incomplete = true;
            summary.fatal_error = e.what();
            log_ << "[LEDGER] Error: " << e.what() << std::endl;
            emitter_.error(run_id_, e.what(), event_out_);
            break;
        }
    }

    pool_ = nullptr;
    compositor_ = nullptr;

    // DRAIN
    const report::Totals totals = summary.totals();
    emitter_.phase_start(run_id_, Phase::DRAIN, "", event_out_);
    emitter_.phase_end(run_id_, Phase::DRAIN, summary.success ? "ok" : "error",
                       report::to_json(totals), event_out_);
    return summary;
}

void Orchestrator::process_category(const fs::path& category_dir, const std::string& category,
                                    report::CategorySummary& cs) {
    std::vector<SubcategoryUnit> units;
    try {
        units = discover_units(category_dir, category, cfg_);
    } catch (const IOError& e) {
        cs.status = "skipped";
        cs.error = e.what();
        log_ << "[DISCOVER] Warning: skipping category " << category << ": " << e.what()
             << std::endl;
        emitter_.warning(run_id_, "category skipped: " + category + ": " + e.what(),
                         event_out_);
        return;
    }

    for (const auto& unit : units) {
        cs.subcategories.emplace_back();
        report::SubcategorySummary& s = cs.subcategories.back();
        s.label = unit.label;
        process_unit(unit, s);
    }
}

void Orchestrator::process_unit(const SubcategoryUnit& unit, report::SubcategorySummary& s) {
    const std::string unit_name = unit.category + "/" + unit.label;

    std::vector<fs::path> files;
    try {
        files = core::list_images(unit.dir, cfg_.input.extensions);
    } catch (const IOError& e) {
        s.status = "skipped";
        s.error = e.what();
        log_ << "[DISCOVER] Warning: skipping " << unit_name << ": " << e.what() << std::endl;
        emitter_.warning(run_id_, "unit skipped: " + unit_name + ": " + e.what(), event_out_);
        return;
    }
    s.images_in_folder = static_cast<int>(files.size());
    log_ << "[DISCOVER] " << unit_name << ": " << files.size() << " images"
         << (unit.is_root() ? " (category root)" : "") << std::endl;

    if (dry_run_) {
        s.status = "dry_run";
        return;
    }

    const GridSpec grid = cfg_.grid.spec();
    const size_t capacity = static_cast<size_t>(grid.capacity());
    int batch_number = ledger_.next_batch_number(unit.category, unit.label);

    std::vector<ImageRecord> candidates;
    size_t cursor = 0;

    emitter_.phase_start(run_id_, Phase::EXTRACT, unit_name, event_out_);
    while (cursor < files.size()) {
        const size_t take = std::min(capacity - candidates.size(), files.size() - cursor);
        std::vector<fs::path> cycle(files.begin() + static_cast<std::ptrdiff_t>(cursor),
                                    files.begin() + static_cast<std::ptrdiff_t>(cursor + take));
        cursor += take;

        for (auto& res : pool_->run_cycle(cycle)) {
            ++s.checked;
            switch (res.status) {
                case ExtractionStatus::Duplicate:
                    ++s.duplicates;
                    s.duplicate_files.push_back(res.filename);
                    emitter_.image_checked(run_id_, unit_name, res.filename, "duplicate",
                                           event_out_);
                    break;
                case ExtractionStatus::Failed:
                    ++s.failed;
                    s.failed_files.push_back(res.filename);
                    log_ << "[EXTRACT] Warning: " << unit_name << "/" << res.filename << ": "
                         << res.error << std::endl;
                    emitter_.image_checked(run_id_, unit_name, res.filename, "failed",
                                           event_out_);
                    break;
                case ExtractionStatus::Candidate:
                    candidates.push_back(std::move(res.record));
                    emitter_.image_checked(run_id_, unit_name, res.filename, "candidate",
                                           event_out_);
                    break;
            }
        }
        emitter_.phase_progress(run_id_, Phase::EXTRACT, static_cast<int>(cursor),
                                static_cast<int>(files.size()), unit_name, event_out_);

        if (candidates.size() < capacity) continue;

        grouping::GroupingResult grouped =
            grouping::group_into_batches(std::move(candidates), grid.capacity());
        candidates = std::move(grouped.leftover);

        for (size_t bi = 0; bi < grouped.batches.size(); ++bi) {
            auto& batch = grouped.batches[bi];
            // RENDER
            emitter_.phase_start(run_id_, Phase::RENDER, unit_name, event_out_);
            compositor::RenderResult rendered;
            try {
                rendered = compositor_->render(batch, unit.category, unit.label, batch_number);
            } catch (const ImageCollateError& e) {
                emitter_.phase_end(run_id_, Phase::RENDER, "error",
                                   {{"unit", unit_name}, {"batch_number", batch_number}},
                                   event_out_);
                s.status = "error";
                s.error = e.what();
                log_ << "[RENDER] Error: " << unit_name << " batch " << batch_number << ": "
                     << e.what() << std::endl;
                emitter_.error(run_id_, unit_name + ": " + e.what(), event_out_);
                for (size_t rest = bi; rest < grouped.batches.size(); ++rest) {
                    ledger_.release(fingerprints_of(grouped.batches[rest]));
                }
                ledger_.release(fingerprints_of(candidates));
                s.leftover = static_cast<int>(candidates.size());
                emitter_.phase_end(run_id_, Phase::EXTRACT, "error", {{"unit", unit_name}},
                                   event_out_);
                return;
            }

            if (!rendered.secondary_error.empty()) {
                const std::string msg =
                    unit_name + ": texture export failed: " + rendered.secondary_error;
                log_ << "[RENDER] Warning: " << msg << std::endl;
                emitter_.warning(run_id_, msg, event_out_);
            }
            emitter_.phase_end(run_id_, Phase::RENDER, "ok",
                               {{"unit", unit_name},
                                {"batch_number", batch_number},
                                {"secondary", rendered.secondary_path.has_value()}},
                               event_out_);

            // LEDGER_APPEND
            emitter_.phase_start(run_id_, Phase::LEDGER_APPEND, unit_name, event_out_);
            std::vector<LedgerEntry> entries;
            entries.reserve(batch.size());
            for (const auto& rec : batch) {
                entries.push_back(LedgerEntry{unit.category, unit.label, batch_number,
                                              rec.fingerprint, rec.filename});
            }
            try {
                ledger_.append(entries);
            } catch (const LedgerError& e) {
                emitter_.phase_end(run_id_, Phase::LEDGER_APPEND, "error",
                                   {{"unit", unit_name}, {"error", e.what()}}, event_out_);
                s.status = "error";
                s.error = e.what();
                for (size_t rest = bi; rest < grouped.batches.size(); ++rest) {
                    ledger_.release(fingerprints_of(grouped.batches[rest]));
                }
                ledger_.release(fingerprints_of(candidates));
                throw;
            }

            emitter_.phase_end(run_id_, Phase::LEDGER_APPEND, "ok",
                               {{"unit", unit_name}, {"entries", entries.size()}}, event_out_);

            s.processed += static_cast<int>(batch.size());
            ++s.stitched;
            s.batches.push_back(report::BatchRecord{batch_number, rendered.primary_path,
                                                    rendered.primary_sha256,
                                                    rendered.secondary_path});
            log_ << "[RENDER] " << unit_name << " batch " << batch_number << " -> "
                 << rendered.primary_path.string() << std::endl;
            emitter_.batch_rendered(run_id_, unit_name, batch_number,
                                    rendered.primary_path.string(),
                                    static_cast<int>(batch.size()), event_out_);
            ++batch_number;
        }
    }

    // Short pool: these images stay unledgered and are retried next run.
    s.leftover = static_cast<int>(candidates.size());
    ledger_.release(fingerprints_of(candidates));
    if (!candidates.empty()) {
        log_ << "[GROUP] " << unit_name << ": " << candidates.size()
             << " images held back (grid needs " << capacity << ")" << std::endl;
    }
    emitter_.phase_end(run_id_, Phase::EXTRACT, "ok",
                       {{"unit", unit_name},
                        {"checked", s.checked},
                        {"duplicates", s.duplicates},
                        {"processed", s.processed},
                        {"stitched", s.stitched}},
                       event_out_);
}

} // namespace image_collate::pipeline
