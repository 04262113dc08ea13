#include "image_collate/report/summary.hpp"

#include <iomanip>

namespace image_collate::report {

using json = nlohmann::json;

Totals& Totals::operator+=(const SubcategorySummary& s) {
    images_in_folder += s.images_in_folder;
    checked += s.checked;
    duplicates += s.duplicates;
    failed += s.failed;
    processed += s.processed;
    leftover += s.leftover;
    stitched += s.stitched;
    return *this;
}

Totals& Totals::operator+=(const Totals& t) {
    images_in_folder += t.images_in_folder;
    checked += t.checked;
    duplicates += t.duplicates;
    failed += t.failed;
    processed += t.processed;
    leftover += t.leftover;
    stitched += t.stitched;
    return *this;
}

Totals CategorySummary::totals() const {
    Totals t;
    for (const auto& s : subcategories) t += s;
    return t;
}

Totals RunSummary::totals() const {
    Totals t;
    for (const auto& c : categories) t += c.totals();
    return t;
}

json to_json(const Totals& t) {
    return json{{"images_in_folder", t.images_in_folder},
                {"checked", t.checked},
                {"duplicates", t.duplicates},
                {"failed", t.failed},
                {"processed", t.processed},
                {"leftover", t.leftover},
                {"stitched", t.stitched}};
}

json to_json(const SubcategorySummary& s) {
    json j;
    j["label"] = s.label;
    j["status"] = s.status;
    if (!s.error.empty()) j["error"] = s.error;
    j["images_in_folder"] = s.images_in_folder;
    j["checked"] = s.checked;
    j["duplicates"] = s.duplicates;
    j["failed"] = s.failed;
    j["processed"] = s.processed;
    j["leftover"] = s.leftover;
    j["stitched"] = s.stitched;
    j["duplicate_files"] = s.duplicate_files;
    j["failed_files"] = s.failed_files;

    json batches = json::array();
    for (const auto& b : s.batches) {
        json jb{{"batch_number", b.batch_number},
                {"path", b.path.string()},
                {"sha256", b.sha256}};
        jb["secondary_path"] = b.secondary_path ? json(b.secondary_path->string()) : json(nullptr);
        batches.push_back(std::move(jb));
    }
    j["batches"] = std::move(batches);
    return j;
}

json to_json(const CategorySummary& c) {
    json j;
    j["name"] = c.name;
    j["status"] = c.status;
    if (!c.error.empty()) j["error"] = c.error;
    json subs = json::array();
    for (const auto& s : c.subcategories) subs.push_back(to_json(s));
    j["subcategories"] = std::move(subs);
    j["totals"] = to_json(c.totals());
    return j;
}

json to_json(const RunSummary& r) {
    json j;
    j["run_id"] = r.run_id;
    j["success"] = r.success;
    j["dry_run"] = r.dry_run;
    j["ledger_incomplete"] = r.ledger_incomplete;
    if (!r.fatal_error.empty()) j["fatal_error"] = r.fatal_error;
    json cats = json::array();
    for (const auto& c : r.categories) cats.push_back(to_json(c));
    j["categories"] = std::move(cats);
    j["totals"] = to_json(r.totals());
    return j;
}

void print_report(const RunSummary& r, std::ostream& out) {
    out << "\n=== Collation summary (" << r.run_id << ") ===\n";
    for (const auto& c : r.categories) {
        out << "Category: " << c.name;
        if (c.status != "ok") out << " [" << c.status << "]";
        out << "\n";
        for (const auto& s : c.subcategories) {
            out << "  " << std::left << std::setw(24) << s.label << std::right
                << " in_folder=" << s.images_in_folder << " checked=" << s.checked
                << " duplicates=" << s.duplicates << " failed=" << s.failed
                << " processed=" << s.processed << " leftover=" << s.leftover
                << " stitched=" << s.stitched;
            if (s.status != "ok") out << " [" << s.status << "]";
            out << "\n";
            if (!s.error.empty()) out << "    error: " << s.error << "\n";
            for (const auto& d : s.duplicate_files) out << "    duplicate: " << d << "\n";
            for (const auto& f : s.failed_files) out << "    failed: " << f << "\n";
        }
    }

    const Totals t = r.totals();
    out << "Totals: in_folder=" << t.images_in_folder << " checked=" << t.checked
        << " duplicates=" << t.duplicates << " failed=" << t.failed
        << " processed=" << t.processed << " leftover=" << t.leftover
        << " stitched=" << t.stitched << "\n";
    if (r.ledger_incomplete) {
        out << "WARNING: ledger may be incomplete; rendered batches may be missing entries\n";
    }
    if (!r.fatal_error.empty()) {
        out << "FATAL: " << r.fatal_error << "\n";
    }
}

} // namespace image_collate::report
