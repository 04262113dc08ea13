#pragma once

#include "image_collate/compositor/compositor.hpp"
#include "image_collate/config/configuration.hpp"
#include "image_collate/core/events.hpp"
#include "image_collate/core/types.hpp"
#include "image_collate/features/perceptual_hash.hpp"
#include "image_collate/io/image_codec.hpp"
#include "image_collate/io/texture_export.hpp"
#include "image_collate/ledger/duplicate_ledger.hpp"
#include "image_collate/pipeline/worker_pool.hpp"
#include "image_collate/report/summary.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace image_collate::pipeline {

// Units of one category directory: one per visible subdirectory, plus the
// category root when it holds images or has no subdirectories.
// Throws IOError when the category cannot be listed.
std::vector<SubcategoryUnit> discover_units(const fs::path& category_dir,
                                            const std::string& category,
                                            const config::Config& cfg);

/**
 * Drives one collation run.
 *
 * Per unit: Discover -> {ExtractCycle -> GroupAndRender}* -> Drain.
 * Extraction runs on the pool; grouping, rendering and ledger writes stay
 * on the calling thread so batch numbers follow save order.
 */
class Orchestrator {
public:
    Orchestrator(const config::Config& cfg, const io::ImageCodec& codec,
                 const features::PerceptualHasher& hasher, ledger::DuplicateLedger& ledger,
                 const io::TextureExporter* exporter, core::EventEmitter& emitter,
                 std::ostream& event_out, std::ostream& log);

    // Throws IOError when the input root is missing and LedgerError when the
    // ledger cannot be loaded. A failed ledger append ends the run early and
    // is reported through RunSummary::fatal_error.
    report::RunSummary run(const fs::path& input_dir, const fs::path& output_dir,
                           const std::string& run_id, bool dry_run = false);

private:
    void process_category(const fs::path& category_dir, const std::string& category,
                          report::CategorySummary& cs);
    void process_unit(const SubcategoryUnit& unit, report::SubcategorySummary& s);

    const config::Config& cfg_;
    const io::ImageCodec& codec_;
    const features::PerceptualHasher& hasher_;
    ledger::DuplicateLedger& ledger_;
    const io::TextureExporter* exporter_;
    core::EventEmitter& emitter_;
    std::ostream& event_out_;
    std::ostream& log_;

    // Valid only for the duration of run().
    std::string run_id_;
    bool dry_run_ = false;
    ExtractionPool* pool_ = nullptr;
    const compositor::Compositor* compositor_ = nullptr;
};

} // namespace image_collate::pipeline
