#include "test_support.hpp"
#include "tomo_preview/core/errors.hpp"
#include "tomo_preview/image/slice_selection.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace tomo_preview;
using image::resolve_slice_range;

TEST_CASE("slice_range_defaults_to_whole_volume") {
    auto r = resolve_slice_range(10, std::nullopt, std::nullopt);
    REQUIRE(r.start == 0);
    REQUIRE(r.end == 10);
}

TEST_CASE("slice_range_by_indices") {
    auto r = resolve_slice_range(10, IndexRange{2, 8}, std::nullopt);
    REQUIRE(r.start == 2);
    REQUIRE(r.end == 8);
    REQUIRE(r.size() == 6);

    REQUIRE_THROWS_AS(resolve_slice_range(10, IndexRange{-1, 5}, std::nullopt), RangeError);
    REQUIRE_THROWS_AS(resolve_slice_range(10, IndexRange{5, 5}, std::nullopt), RangeError);
    REQUIRE_THROWS_AS(resolve_slice_range(10, IndexRange{6, 4}, std::nullopt), RangeError);
    REQUIRE_THROWS_AS(resolve_slice_range(10, IndexRange{0, 11}, std::nullopt), RangeError);
}

TEST_CASE("slice_range_by_fractions_floors_both_ends") {
    auto r = resolve_slice_range(10, std::nullopt, FractionRange{0.25, 0.15});
    REQUIRE(r.start == 2);
    REQUIRE(r.end == 9);

    auto none = resolve_slice_range(7, std::nullopt, FractionRange{0.0, 0.0});
    REQUIRE(none.start == 0);
    REQUIRE(none.end == 7);

    REQUIRE_THROWS_AS(resolve_slice_range(10, std::nullopt, FractionRange{0.6, 0.5}), RangeError);
    REQUIRE_THROWS_AS(resolve_slice_range(10, std::nullopt, FractionRange{1.0, 0.0}), RangeError);
    REQUIRE_THROWS_AS(resolve_slice_range(10, std::nullopt, FractionRange{-0.1, 0.0}), RangeError);
}

TEST_CASE("slice_range_index_range_wins_over_fractions") {
    auto r = resolve_slice_range(10, IndexRange{1, 3}, FractionRange{0.5, 0.0});
    REQUIRE(r.start == 1);
    REQUIRE(r.end == 3);
}

TEST_CASE("select_slices_returns_view_of_kept_slices") {
    const auto slices = test::ramp_slices(5, 2, 3);
    Volume volume = Volume::from_slices(slices);

    Volume kept = image::select_slices(volume, IndexRange{1, 4}, std::nullopt);
    REQUIRE(kept.depth() == 3);
    REQUIRE(kept.slice(0) == slices[1]);
    REQUIRE(kept.slice(2) == slices[3]);

    Volume whole = image::select_slices(volume, std::nullopt, std::nullopt);
    REQUIRE(whole.depth() == 5);
}

TEST_CASE("select_slices_depth_10_examples") {
    const auto slices = test::ramp_slices(10, 2, 2);
    Volume volume = Volume::from_slices(slices);

    Volume mid = image::select_slices(volume, IndexRange{2, 5}, std::nullopt);
    REQUIRE(mid.depth() == 3);
    REQUIRE(mid.slice(0) == slices[2]);
    REQUIRE(mid.slice(2) == slices[4]);

    REQUIRE(image::select_slices(volume, IndexRange{0, 10}, std::nullopt).depth() == 10);

    Volume trimmed = image::select_slices(volume, std::nullopt, FractionRange{0.1, 0.1});
    REQUIRE(trimmed.depth() == 8);
    REQUIRE(trimmed.slice(0) == slices[1]);
    REQUIRE(trimmed.slice(7) == slices[8]);
}
