#include "image_collate/core/errors.hpp"
#include "image_collate/grouping/batch_grouper.hpp"

#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <random>

using namespace image_collate;
using image_collate::testing::make_record;

namespace {

std::vector<std::string> names(const std::vector<ImageRecord>& v) {
    std::vector<std::string> out;
    for (const auto& r : v) out.push_back(r.filename);
    return out;
}

std::vector<ImageRecord> sample_pool() {
    return {
        make_record("bright.png", 0.0, 0.9),
        make_record("dark.png", 0.8, 0.0),
        make_record("mid_gray.png", 0.1, 0.1, Color3d(128, 128, 128)),
        make_record("mid_red.png", 0.1, 0.1, Color3d(255, 0, 0)),
        make_record("darker.png", 0.9, 0.0),
        make_record("b_tie.png", 0.0, 0.5),
        make_record("a_tie.png", 0.0, 0.5),
        make_record("plain.png", 0.0, 0.0),
    };
}

} // namespace

TEST_CASE("color_distance_from_gray_is_l2") {
    REQUIRE(grouping::color_distance_from_gray(Color3d(128, 128, 128)) == Catch::Approx(0.0));
    REQUIRE(grouping::color_distance_from_gray(Color3d(131, 132, 128)) == Catch::Approx(5.0));
}

TEST_CASE("similarity_order_puts_dark_first_then_least_white") {
    auto pool = sample_pool();
    grouping::sort_by_similarity(pool);
    REQUIRE(names(pool) == std::vector<std::string>{"darker.png", "dark.png", "mid_gray.png",
                                                    "mid_red.png", "plain.png", "a_tie.png",
                                                    "b_tie.png", "bright.png"});
}

TEST_CASE("grouping_is_independent_of_input_order") {
    const auto reference = grouping::group_into_batches(sample_pool(), 4);
    REQUIRE(reference.batches.size() == 2);

    std::mt19937 rng(1234);
    for (int i = 0; i < 20; ++i) {
        auto pool = sample_pool();
        std::shuffle(pool.begin(), pool.end(), rng);
        const auto result = grouping::group_into_batches(std::move(pool), 4);
        REQUIRE(result.batches.size() == reference.batches.size());
        for (size_t b = 0; b < result.batches.size(); ++b) {
            REQUIRE(names(result.batches[b]) == names(reference.batches[b]));
        }
        REQUIRE(result.leftover.empty());
    }
}

TEST_CASE("grouping_slices_full_batches_and_keeps_remainder") {
    auto pool = sample_pool();
    pool.push_back(make_record("extra.png", 0.0, 1.0));
    const auto result = grouping::group_into_batches(std::move(pool), 4);

    REQUIRE(result.batches.size() == 2);
    for (const auto& b : result.batches) REQUIRE(b.size() == 4);
    REQUIRE(names(result.leftover) == std::vector<std::string>{"extra.png"});
}

TEST_CASE("grouping_short_pool_is_returned_unchanged") {
    std::vector<ImageRecord> pool{make_record("z.png", 0.0, 0.9), make_record("a.png", 0.9, 0.0)};
    const auto result = grouping::group_into_batches(pool, 4);
    REQUIRE(result.batches.empty());
    REQUIRE(names(result.leftover) == std::vector<std::string>{"z.png", "a.png"});
}

TEST_CASE("grouping_rejects_zero_capacity") {
    REQUIRE_THROWS_AS(grouping::group_into_batches({}, 0), ValidationError);
}
