#pragma once

#include "tomo_preview/core/types.hpp"
#include "tomo_preview/core/volume.hpp"
#include "tomo_preview/pipeline/worker_pool.hpp"

#include <opencv2/core.hpp>

#include <functional>
#include <vector>

namespace tomo_preview::pipeline {

using FrameFn = std::function<cv::Mat(size_t index, int worker)>;

// Builds frames[i] = make_frame(i, worker) for i in [0, count) on a bounded
// pool, stored by index. Any failure fails the whole run with
// SliceProcessingError for the lowest failing index.
std::vector<cv::Mat> process_slices(size_t count, const FrameFn &make_frame,
                                    int concurrency, const ProgressFn &progress = {});

// Normalizes and enhances every slice on a bounded worker pool.
// frames[i] always corresponds to volume slice i. Each worker keeps its own
// CLAHE cache of `cache_capacity` entries. If any slice fails the whole run
// fails with SliceProcessingError for the lowest failing index.
std::vector<cv::Mat> process_volume(const Volume &volume, const GlobalStats &stats,
                                    const EnhancementParams &params, int concurrency,
                                    const ProgressFn &progress = {},
                                    size_t cache_capacity = 8);

} // namespace tomo_preview::pipeline
