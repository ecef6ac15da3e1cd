#include "tomo_preview/core/errors.hpp"
#include "tomo_preview/image/enhancement.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace tomo_preview;

namespace {

cv::Mat gradient_slice(int rows, int cols) {
    cv::Mat m(rows, cols, CV_8UC1);
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            m.at<uint8_t>(y, x) = static_cast<uint8_t>(100 + (x + y) % 40);
        }
    }
    return m;
}

} // namespace

TEST_CASE("adaptive_clip_follows_dynamic_range") {
    EnhancementParams base;
    base.clip_limit = 2.0;
    base.tile_grid_size = 16;

    auto low = image::adapt_enhancement_params(base, GlobalStats{0.0f, 255.0f});
    REQUIRE(low.clip_limit == 2.0);
    REQUIRE(low.tile_grid_size == 16);

    auto mid = image::adapt_enhancement_params(base, GlobalStats{0.0f, 5000.0f});
    REQUIRE(mid.clip_limit == 5.0);

    auto high = image::adapt_enhancement_params(base, GlobalStats{-30000.0f, 30000.0f});
    REQUIRE(high.clip_limit == 30.0);

    base.clip_limit = 100.0;
    REQUIRE(image::adapt_enhancement_params(base, GlobalStats{0.0f, 10.0f}).clip_limit == 5.0);
    REQUIRE(image::adapt_enhancement_params(base, GlobalStats{0.0f, 65535.0f}).clip_limit == 1000.0);
}

TEST_CASE("enhance_slice_keeps_shape_and_type") {
    cv::Mat in = gradient_slice(37, 53);
    cv::Mat out = image::enhance_slice(in, EnhancementParams{2.0, 8});
    REQUIRE(out.type() == CV_8UC1);
    REQUIRE(out.rows == 37);
    REQUIRE(out.cols == 53);
}

TEST_CASE("enhance_slice_stretches_low_contrast_input") {
    cv::Mat in = gradient_slice(64, 64);
    cv::Mat out = image::enhance_slice(in, EnhancementParams{4.0, 4});

    double in_min, in_max, out_min, out_max;
    cv::minMaxLoc(in, &in_min, &in_max);
    cv::minMaxLoc(out, &out_min, &out_max);
    REQUIRE(out_max - out_min > in_max - in_min);
}

TEST_CASE("enhance_slice_rejects_invalid_input") {
    REQUIRE_THROWS_AS(image::enhance_slice(cv::Mat(), EnhancementParams{}), ValidationError);
    REQUIRE_THROWS_AS(image::enhance_slice(cv::Mat(8, 8, CV_32FC1, cv::Scalar(0)),
                                           EnhancementParams{}),
                      ValidationError);
    REQUIRE_THROWS_AS(image::enhance_slice(gradient_slice(8, 8), EnhancementParams{0.0, 8}),
                      ValidationError);
    REQUIRE_THROWS_AS(image::enhance_slice(gradient_slice(8, 8), EnhancementParams{2.0, 0}),
                      ValidationError);
}

TEST_CASE("clahe_cache_reuses_and_evicts_oldest") {
    image::ClaheCache cache(2);
    auto a = cache.get(EnhancementParams{2.0, 8});
    REQUIRE(cache.get(EnhancementParams{2.0, 8}) == a);
    REQUIRE(cache.size() == 1);

    cache.get(EnhancementParams{3.0, 8});
    cache.get(EnhancementParams{2.0, 16});
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.capacity() == 2);
    // (2.0, 8) was evicted, so a fresh instance is created.
    REQUIRE(cache.get(EnhancementParams{2.0, 8}) != a);
}
