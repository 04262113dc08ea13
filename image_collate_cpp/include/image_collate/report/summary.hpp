#pragma once

#include "image_collate/core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace image_collate::report {

struct BatchRecord {
    int batch_number = 0;
    fs::path path;
    std::string sha256;
    std::optional<fs::path> secondary_path;
};

struct SubcategorySummary {
    std::string label;
    std::string status = "ok"; // ok | skipped | error | dry_run
    std::string error;

    int images_in_folder = 0;
    int checked = 0;
    int duplicates = 0;
    int failed = 0;
    int processed = 0;
    int leftover = 0;
    int stitched = 0;

    std::vector<std::string> duplicate_files;
    std::vector<std::string> failed_files;
    std::vector<BatchRecord> batches;
};

struct Totals {
    int images_in_folder = 0;
    int checked = 0;
    int duplicates = 0;
    int failed = 0;
    int processed = 0;
    int leftover = 0;
    int stitched = 0;

    Totals& operator+=(const SubcategorySummary& s);
    Totals& operator+=(const Totals& t);
};

struct CategorySummary {
    std::string name;
    std::string status = "ok";
    std::string error;
    std::vector<SubcategorySummary> subcategories;

    Totals totals() const;
};

struct RunSummary {
    std::string run_id;
    bool success = true;
    bool dry_run = false;
    bool ledger_incomplete = false;
    std::string fatal_error;
    std::vector<CategorySummary> categories;

    Totals totals() const;
};

nlohmann::json to_json(const Totals& t);
nlohmann::json to_json(const SubcategorySummary& s);
nlohmann::json to_json(const CategorySummary& c);
nlohmann::json to_json(const RunSummary& r);

// Human-readable per-unit report plus run totals.
void print_report(const RunSummary& r, std::ostream& out);

} // namespace image_collate::report
