#include "test_support.hpp"
#include "tomo_preview/core/errors.hpp"
#include "tomo_preview/image/enhancement.hpp"
#include "tomo_preview/image/normalization.hpp"
#include "tomo_preview/pipeline/slice_pipeline.hpp"
#include "tomo_preview/pipeline/worker_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <stdexcept>

using namespace tomo_preview;

TEST_CASE("worker_count_resolution") {
    REQUIRE(pipeline::resolve_worker_count(4, 100) == 4);
    REQUIRE(pipeline::resolve_worker_count(8, 3) == 3);
    REQUIRE(pipeline::resolve_worker_count(64, 100, 32) == 32);
    REQUIRE(pipeline::resolve_worker_count(0, 1) == 1);
    REQUIRE(pipeline::resolve_worker_count(0, 1000) >= 1);
}

TEST_CASE("indexed_tasks_run_every_index_once") {
    std::vector<int> hits(200, 0);
    std::atomic<bool> bad_worker{false};
    bool monotonic = true;
    size_t last_done = 0;
    auto failures = pipeline::run_indexed_tasks(
        hits.size(), 6,
        [&](size_t i, int worker) {
            if (worker < 0 || worker >= 6) {
                bad_worker = true;
            }
            hits[i] += 1;
        },
        [&](size_t done, size_t total) {
            monotonic = monotonic && total == 200 && done > last_done;
            last_done = done;
        });
    REQUIRE(failures.empty());
    REQUIRE_FALSE(bad_worker.load());
    REQUIRE(monotonic);
    REQUIRE(last_done == 200);
    for (int h : hits) {
        REQUIRE(h == 1);
    }
}

TEST_CASE("indexed_task_progress_never_goes_backwards") {
    int non_monotonic_runs = 0;
    for (int run = 0; run < 300; ++run) {
        size_t last = 0;
        bool monotonic = true;
        pipeline::run_indexed_tasks(
            200, 6, [](size_t, int) {},
            [&](size_t done, size_t) {
                monotonic = monotonic && done == last + 1;
                last = done;
            });
        if (!monotonic || last != 200) {
            ++non_monotonic_runs;
        }
    }
    REQUIRE(non_monotonic_runs == 0);
}

TEST_CASE("indexed_task_failures_are_collected_in_index_order") {
    std::atomic<int> completed{0};
    auto failures = pipeline::run_indexed_tasks(20, 4, [&](size_t i, int) {
        if (i == 13 || i == 4) {
            throw std::runtime_error("bad slice " + std::to_string(i));
        }
        completed.fetch_add(1);
    });
    REQUIRE(completed.load() == 18);
    REQUIRE(failures.size() == 2);
    REQUIRE(failures[0].index == 4);
    REQUIRE(failures[0].message == "bad slice 4");
    REQUIRE(failures[1].index == 13);
}

TEST_CASE("process_volume_orders_frames_by_slice_index") {
    const auto slices = test::ramp_slices(9, 24, 32);
    Volume volume = Volume::from_slices(slices);
    const GlobalStats stats = image::compute_global_stats(volume);
    const EnhancementParams params{2.0, 4};

    auto parallel = pipeline::process_volume(volume, stats, params, 4);
    auto serial = pipeline::process_volume(volume, stats, params, 1);
    REQUIRE(parallel.size() == 9);
    REQUIRE(serial.size() == 9);

    for (size_t i = 0; i < slices.size(); ++i) {
        cv::Mat expected =
            image::enhance_slice(image::normalize_to_u8(slices[i], stats), params);
        REQUIRE(parallel[i].type() == CV_8UC1);
        REQUIRE(cv::norm(parallel[i], expected, cv::NORM_INF) == 0.0);
        REQUIRE(cv::norm(serial[i], expected, cv::NORM_INF) == 0.0);
    }
}

TEST_CASE("process_volume_reports_progress_per_slice") {
    Volume volume = Volume::from_slices(test::ramp_slices(5, 8, 8));
    size_t calls = 0;
    size_t last_total = 0;
    pipeline::process_volume(volume, image::compute_global_stats(volume),
                             EnhancementParams{}, 2,
                             [&](size_t, size_t total) {
                                 last_total = total;
                                 ++calls;
                             });
    REQUIRE(calls == 5);
    REQUIRE(last_total == 5);
}

TEST_CASE("process_volume_rejects_invalid_params") {
    Volume volume = Volume::from_slices(test::ramp_slices(2, 8, 8));
    REQUIRE_THROWS_AS(pipeline::process_volume(volume, GlobalStats{0.0f, 1.0f},
                                               EnhancementParams{-1.0, 8}, 2),
                      ValidationError);
}

TEST_CASE("slice_failure_fails_volume_with_lowest_index") {
    const auto slices = test::ramp_slices(8, 16, 16);
    Volume volume = Volume::from_slices(slices);
    const GlobalStats stats = image::compute_global_stats(volume);
    const EnhancementParams params{2.0, 4};

    // Slices 6 and 3 hand the enhancer an empty image.
    auto make_frame = [&](size_t i, int) {
        cv::Mat normalized = image::normalize_to_u8(volume.slice(i), stats);
        if (i == 6 || i == 3) {
            normalized = cv::Mat();
        }
        return image::enhance_slice(normalized, params);
    };

    std::optional<size_t> failed_index;
    std::string message;
    try {
        pipeline::process_slices(volume.depth(), make_frame, 4);
    } catch (const SliceProcessingError& e) {
        failed_index = e.slice_index();
        message = e.what();
    }
    REQUIRE(failed_index);
    REQUIRE(*failed_index == 3);
    REQUIRE(message.find("empty") != std::string::npos);
}

TEST_CASE("process_slices_keeps_frames_by_index") {
    auto frames = pipeline::process_slices(
        12, [](size_t i, int) { return cv::Mat(2, 2, CV_8UC1, cv::Scalar(static_cast<int>(i))); },
        5);
    REQUIRE(frames.size() == 12);
    for (size_t i = 0; i < frames.size(); ++i) {
        REQUIRE(frames[i].at<uint8_t>(1, 1) == i);
    }
}
