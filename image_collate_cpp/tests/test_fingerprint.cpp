#include "image_collate/core/errors.hpp"
#include "image_collate/core/types.hpp"
#include "image_collate/features/perceptual_hash.hpp"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/core.hpp>

using image_collate::Fingerprint;

TEST_CASE("fingerprint_hex_is_sixteen_lowercase_digits") {
    Fingerprint fp;
    fp.bits = 0x00ab00000000ff01ULL;
    REQUIRE(fp.to_hex() == "00ab00000000ff01");

    auto parsed = Fingerprint::from_hex("00AB00000000FF01");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == fp);
}

TEST_CASE("fingerprint_from_hex_rejects_garbage") {
    REQUIRE_FALSE(Fingerprint::from_hex("").has_value());
    REQUIRE_FALSE(Fingerprint::from_hex("xyz").has_value());
    REQUIRE_FALSE(Fingerprint::from_hex("0123456789abcdef0").has_value());
    REQUIRE(Fingerprint::from_hex(" ff ").has_value());
}

TEST_CASE("fingerprint_hamming_distance") {
    Fingerprint a, b;
    a.bits = 0b1011;
    b.bits = 0b0001;
    REQUIRE(a.hamming_distance(b) == 2);
    REQUIRE(a.hamming_distance(a) == 0);
}

TEST_CASE("dct_hash_is_deterministic_and_content_sensitive") {
    image_collate::features::DctHasher hasher;

    cv::RNG rng(42);
    cv::Mat a(64, 64, CV_8UC3);
    cv::Mat b(64, 64, CV_8UC3);
    rng.fill(a, cv::RNG::UNIFORM, 0, 256);
    rng.fill(b, cv::RNG::UNIFORM, 0, 256);

    const Fingerprint a1 = hasher.hash(a);
    const Fingerprint a2 = hasher.hash(a.clone());
    const Fingerprint fb = hasher.hash(b);

    REQUIRE(a1 == a2);
    REQUIRE(a1 != fb);
    REQUIRE(a1.hamming_distance(fb) > 4);
}

TEST_CASE("dct_hash_tolerates_rescaling") {
    image_collate::features::DctHasher hasher;

    cv::Mat big(256, 256, CV_8UC3, cv::Scalar(20, 20, 20));
    big(cv::Rect(128, 0, 128, 128)).setTo(cv::Scalar(230, 230, 230));
    big(cv::Rect(0, 128, 128, 128)).setTo(cv::Scalar(120, 120, 120));

    cv::Mat small(64, 64, CV_8UC3, cv::Scalar(20, 20, 20));
    small(cv::Rect(32, 0, 32, 32)).setTo(cv::Scalar(230, 230, 230));
    small(cv::Rect(0, 32, 32, 32)).setTo(cv::Scalar(120, 120, 120));

    REQUIRE(hasher.hash(big).hamming_distance(hasher.hash(small)) <= 2);
}

TEST_CASE("dct_hash_rejects_bad_geometry_and_empty_input") {
    REQUIRE_THROWS_AS(image_collate::features::DctHasher(9, 4), image_collate::ValidationError);
    REQUIRE_THROWS_AS(image_collate::features::DctHasher(3, 1), image_collate::ValidationError);

    image_collate::features::DctHasher hasher;
    REQUIRE_THROWS_AS(hasher.hash(cv::Mat()), image_collate::DecodeError);
}
