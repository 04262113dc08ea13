#include "image_collate/core/errors.hpp"
#include "image_collate/pipeline/orchestrator.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <sstream>
#include <utility>

using namespace image_collate;
using image_collate::testing::FakeCodec;
using image_collate::testing::FakeHasher;
using image_collate::testing::TempDir;

namespace {

config::Config small_grid_config() {
    config::Config cfg;
    cfg.grid.cell_width = 4;
    cfg.grid.cell_height = 4;
    cfg.runtime.parallel_workers = 3;
    return cfg;
}

void make_images(const fs::path& dir, const std::string& prefix, int first_id, int count) {
    for (int i = 0; i < count; ++i) {
        char name[64];
        std::snprintf(name, sizeof(name), "%s_%02d.png", prefix.c_str(), i + 1);
        testing::write_fake_image(dir / name, first_id + i);
    }
}

struct Harness {
    explicit Harness(const std::string& tag, config::Config c = small_grid_config())
        : tmp(tag), cfg(std::move(c)) {
        input = tmp.path() / "in";
        output = tmp.path() / "out";
        fs::create_directories(input);
    }

    report::RunSummary run(bool dry_run = false) {
        ledger::DuplicateLedger ledger(ledger_path());
        pipeline::Orchestrator orch(cfg, codec, hasher, ledger, exporter, emitter, events, log);
        return orch.run(input, output, "test_run", dry_run);
    }

    fs::path ledger_path() const { return output / cfg.ledger.path; }

    TempDir tmp;
    config::Config cfg;
    fs::path input;
    fs::path output;
    FakeCodec codec;
    FakeHasher hasher;
    const io::TextureExporter* exporter = nullptr;
    core::EventEmitter emitter;
    std::ostringstream events;
    std::ostringstream log;
};

class BrokenConverter : public io::TextureExporter {
public:
    io::ExportResult export_texture(const fs::path&, const fs::path&) const override {
        io::ExportResult r;
        r.error_message = "converter exited with status 2";
        return r;
    }
};

int count_events(const std::string& jsonl, const std::string& type) {
    std::istringstream in(jsonl);
    std::string line;
    int n = 0;
    while (std::getline(in, line)) {
        if (nlohmann::json::parse(line)["type"] == type) ++n;
    }
    return n;
}

const report::SubcategorySummary& only_unit(const report::RunSummary& s) {
    REQUIRE(s.categories.size() == 1);
    REQUIRE(s.categories[0].subcategories.size() == 1);
    return s.categories[0].subcategories[0];
}

} // namespace

TEST_CASE("seventeen_images_render_one_batch_then_are_all_duplicates") {
    Harness h("orch_17");
    make_images(h.input / "Sketches", "img", 1, 17);

    const report::RunSummary first = h.run();
    REQUIRE(first.success);
    const auto& u1 = only_unit(first);
    REQUIRE(first.categories[0].name == "Sketches");
    REQUIRE(u1.label == "main");
    REQUIRE(u1.images_in_folder == 17);
    REQUIRE(u1.checked == 17);
    REQUIRE(u1.processed == 16);
    REQUIRE(u1.stitched == 1);
    REQUIRE(u1.duplicates == 0);
    REQUIRE(u1.leftover == 1);
    REQUIRE(u1.batches.size() == 1);
    REQUIRE(u1.batches[0].batch_number == 1);
    REQUIRE(fs::exists(h.output / "Sketches-main-1.png"));

    auto lines = testing::read_lines(h.ledger_path());
    REQUIRE(lines.size() == 17);
    REQUIRE(lines[0] == ledger::kLedgerHeader);
    REQUIRE(lines[1].rfind("Sketches,main,1,", 0) == 0);

    const report::RunSummary second = h.run();
    REQUIRE(second.success);
    const auto& u2 = only_unit(second);
    REQUIRE(u2.checked == 17);
    REQUIRE(u2.duplicates == 16);
    REQUIRE(u2.processed == 0);
    REQUIRE(u2.stitched == 0);
    REQUIRE(u2.leftover == 1);
    REQUIRE(u2.duplicate_files.size() == 16);
    REQUIRE_FALSE(fs::exists(h.output / "Sketches-main-2.png"));
    REQUIRE(testing::read_lines(h.ledger_path()).size() == 17);
}

TEST_CASE("batch_numbers_are_dense_and_every_batch_is_full") {
    Harness h("orch_33");
    make_images(h.input / "Cat", "p", 100, 33);

    const auto s = h.run();
    const auto& u = only_unit(s);
    REQUIRE(u.stitched == 2);
    REQUIRE(u.processed == 32);
    REQUIRE(u.leftover == 1);
    REQUIRE(u.batches[0].batch_number == 1);
    REQUIRE(u.batches[1].batch_number == 2);
    REQUIRE(fs::exists(h.output / "Cat-main-1.png"));
    REQUIRE(fs::exists(h.output / "Cat-main-2.png"));

    const auto lines = testing::read_lines(h.ledger_path());
    REQUIRE(lines.size() == 33);
    int batch1 = 0, batch2 = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].rfind("Cat,main,1,", 0) == 0) ++batch1;
        if (lines[i].rfind("Cat,main,2,", 0) == 0) ++batch2;
    }
    REQUIRE(batch1 == 16);
    REQUIRE(batch2 == 16);

    for (const auto& img : h.codec.saved_images) {
        REQUIRE(img.cols == 16);
        REQUIRE(img.rows == 16);
    }
}

TEST_CASE("later_runs_continue_batch_numbering") {
    Harness h("orch_continue");
    make_images(h.input / "Cat", "a", 1, 16);
    REQUIRE(only_unit(h.run()).stitched == 1);

    make_images(h.input / "Cat", "b", 500, 16);
    const auto s = h.run();
    const auto& u = only_unit(s);
    REQUIRE(u.duplicates == 16);
    REQUIRE(u.stitched == 1);
    REQUIRE(u.batches[0].batch_number == 2);
    REQUIRE(fs::exists(h.output / "Cat-main-2.png"));
}

TEST_CASE("decode_failures_are_counted_and_skipped") {
    Harness h("orch_corrupt");
    make_images(h.input / "Cat", "ok", 1, 16);
    testing::write_fake_image(h.input / "Cat" / "corrupt_a.png", 0);
    testing::write_fake_image(h.input / "Cat" / "corrupt_b.png", 0);

    const auto s = h.run();
    const auto& u = only_unit(s);
    REQUIRE(u.checked == 18);
    REQUIRE(u.failed == 2);
    REQUIRE(u.processed == 16);
    REQUIRE(u.stitched == 1);
    REQUIRE(u.duplicates == 0);
    REQUIRE(u.failed_files == std::vector<std::string>{"corrupt_a.png", "corrupt_b.png"});
}

TEST_CASE("duplicate_content_under_other_names_is_excluded") {
    Harness h("orch_dupes");
    make_images(h.input / "Art" / "a", "x", 1, 16);
    make_images(h.input / "Art" / "b", "y", 1, 16);

    const auto s = h.run();
    REQUIRE(s.categories.size() == 1);
    const auto& subs = s.categories[0].subcategories;
    REQUIRE(subs.size() == 2);
    REQUIRE(subs[0].label == "a");
    REQUIRE(subs[0].stitched == 1);
    REQUIRE(subs[1].label == "b");
    REQUIRE(subs[1].duplicates == 16);
    REQUIRE(subs[1].stitched == 0);
    REQUIRE(testing::read_lines(h.ledger_path()).size() == 17);
}

TEST_CASE("in_run_duplicates_do_not_fill_a_batch") {
    Harness h("orch_inrun");
    make_images(h.input / "Cat", "a", 1, 15);
    testing::write_fake_image(h.input / "Cat" / "a_99.png", 1);

    const auto s = h.run();
    const auto& u = only_unit(s);
    REQUIRE(u.duplicates == 1);
    REQUIRE(u.stitched == 0);
    REQUIRE(u.leftover == 15);
    REQUIRE_FALSE(fs::exists(h.ledger_path()));
}

TEST_CASE("root_pool_label_avoids_real_main_subdirectory") {
    Harness h("orch_main");
    make_images(h.input / "C", "root", 1, 16);
    make_images(h.input / "C" / "main", "sub", 200, 16);

    const auto s = h.run();
    const auto& subs = s.categories[0].subcategories;
    REQUIRE(subs.size() == 2);
    REQUIRE(subs[0].label == "main_root");
    REQUIRE(subs[1].label == "main");
    REQUIRE(fs::exists(h.output / "C-main_root-1.png"));
    REQUIRE(fs::exists(h.output / "C-main-1.png"));
}

TEST_CASE("empty_units_and_hidden_directories_are_harmless") {
    Harness h("orch_empty");
    fs::create_directories(h.input / "Empty");
    fs::create_directories(h.input / ".cache");
    make_images(h.input / "Cat" / ".thumbs", "t", 1, 16);
    make_images(h.input / "Cat", "a", 1, 3);

    const auto s = h.run();
    REQUIRE(s.success);
    REQUIRE(s.categories.size() == 2);
    REQUIRE(s.categories[0].name == "Cat");
    REQUIRE(s.categories[0].subcategories.size() == 1);
    REQUIRE(s.categories[0].subcategories[0].leftover == 3);
    REQUIRE(s.categories[1].name == "Empty");
    REQUIRE(s.categories[1].subcategories[0].images_in_folder == 0);
    REQUIRE(s.totals().stitched == 0);
}

TEST_CASE("output_directory_inside_input_is_not_a_category") {
    Harness h("orch_nested");
    h.output = h.input / "collated";
    make_images(h.input / "Cat", "a", 1, 16);

    const auto first = h.run();
    REQUIRE(first.categories.size() == 1);
    const auto second = h.run();
    REQUIRE(second.categories.size() == 1);
    REQUIRE(second.categories[0].name == "Cat");
}

TEST_CASE("missing_input_root_is_fatal") {
    Harness h("orch_missing");
    fs::remove_all(h.input);
    REQUIRE_THROWS_AS(h.run(), IOError);
}

TEST_CASE("corrupt_ledger_aborts_before_rendering") {
    Harness h("orch_bad_ledger");
    make_images(h.input / "Cat", "a", 1, 16);
    fs::create_directories(h.output);
    {
        std::ofstream out(h.ledger_path());
        out << ledger::kLedgerHeader << "\nCat,main,1,zzzz,a.png\n";
    }
    REQUIRE_THROWS_AS(h.run(), LedgerError);
    REQUIRE(h.codec.saved_paths.empty());
}

TEST_CASE("ledger_append_failure_flags_incomplete_ledger") {
    config::Config cfg = small_grid_config();
    Harness h("orch_append_fail", cfg);
    h.cfg.ledger.path = "no_such_dir/log.csv";
    make_images(h.input / "Cat", "a", 1, 16);
    make_images(h.input / "Dog", "d", 300, 16);

    const auto s = h.run();
    REQUIRE_FALSE(s.success);
    REQUIRE(s.ledger_incomplete);
    REQUIRE_FALSE(s.fatal_error.empty());
    REQUIRE(s.categories.size() == 1);
    REQUIRE(s.categories[0].subcategories[0].status == "error");
    REQUIRE(h.codec.saved_paths.size() == 1);
}

TEST_CASE("render_failure_marks_unit_and_continues") {
    Harness h("orch_render_fail");
    h.codec.fail_saves = true;
    make_images(h.input / "Cat", "a", 1, 16);
    make_images(h.input / "Dog", "d", 300, 3);

    const auto s = h.run();
    REQUIRE(s.success);
    REQUIRE(s.categories.size() == 2);
    REQUIRE(s.categories[0].subcategories[0].status == "error");
    REQUIRE(s.categories[0].subcategories[0].stitched == 0);
    REQUIRE(s.categories[1].subcategories[0].leftover == 3);
    REQUIRE_FALSE(fs::exists(h.ledger_path()));
}

TEST_CASE("dry_run_only_counts") {
    Harness h("orch_dry");
    make_images(h.input / "Cat", "a", 1, 20);

    const auto s = h.run(true);
    const auto& u = only_unit(s);
    REQUIRE(s.dry_run);
    REQUIRE(u.status == "dry_run");
    REQUIRE(u.images_in_folder == 20);
    REQUIRE(u.checked == 0);
    REQUIRE_FALSE(fs::exists(h.output));
}

TEST_CASE("events_are_json_lines_with_run_id") {
    Harness h("orch_events");
    make_images(h.input / "Cat", "a", 1, 16);
    testing::write_fake_image(h.input / "Cat" / "a_dup.png", 1);
    h.run();

    std::istringstream in(h.events.str());
    std::string line;
    int rendered = 0, duplicates = 0;
    while (std::getline(in, line)) {
        const auto ev = nlohmann::json::parse(line);
        REQUIRE(ev["run_id"] == "test_run");
        REQUIRE(ev.contains("ts"));
        if (ev["type"] == "batch_rendered") ++rendered;
        if (ev["type"] == "duplicate_found") ++duplicates;
    }
    REQUIRE(rendered == 1);
    REQUIRE(duplicates == 1);
}

TEST_CASE("run_summary_serializes_to_json") {
    Harness h("orch_json");
    make_images(h.input / "Cat", "a", 1, 17);
    const auto j = report::to_json(h.run());
    REQUIRE(j["run_id"] == "test_run");
    REQUIRE(j["totals"]["stitched"] == 1);
    REQUIRE(j["categories"][0]["subcategories"][0]["batches"][0]["sha256"].get<std::string>().size() == 64);
}

TEST_CASE("failed_texture_export_warns_but_commits_batch") {
    Harness h("orch_texture");
    BrokenConverter converter;
    h.exporter = &converter;
    make_images(h.input / "Cat", "a", 1, 16);

    const report::RunSummary s = h.run();
    REQUIRE(s.success);
    const auto& u = only_unit(s);
    REQUIRE(u.status == "ok");
    REQUIRE(u.stitched == 1);
    REQUIRE_FALSE(u.batches[0].secondary_path.has_value());
    REQUIRE(testing::read_lines(h.ledger_path()).size() == 17);
    REQUIRE(count_events(h.events.str(), "warning") == 1);
    REQUIRE(h.log.str().find("texture export failed: converter exited with status 2") !=
            std::string::npos);
}
