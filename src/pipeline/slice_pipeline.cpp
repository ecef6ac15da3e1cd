#include "tomo_preview/pipeline/slice_pipeline.hpp"
#include "tomo_preview/core/errors.hpp"
#include "tomo_preview/image/enhancement.hpp"
#include "tomo_preview/image/normalization.hpp"

namespace tomo_preview::pipeline {

std::vector<cv::Mat> process_slices(size_t count, const FrameFn &make_frame,
                                    int concurrency, const ProgressFn &progress) {
  std::vector<cv::Mat> frames(count);
  if (count == 0) {
    return frames;
  }

  auto failures = run_indexed_tasks(
      count, resolve_worker_count(concurrency, count),
      [&](size_t i, int worker) { frames[i] = make_frame(i, worker); }, progress);

  if (!failures.empty()) {
    throw SliceProcessingError(failures.front().index, failures.front().message);
  }
  return frames;
}

std::vector<cv::Mat> process_volume(const Volume &volume, const GlobalStats &stats,
                                    const EnhancementParams &params, int concurrency,
                                    const ProgressFn &progress,
                                    size_t cache_capacity) {
  image::validate_enhancement_params(params);

  const size_t depth = volume.depth();
  if (depth == 0) {
    return {};
  }

  const int workers = resolve_worker_count(concurrency, depth);
  std::vector<image::ClaheCache> caches;
  caches.reserve(static_cast<size_t>(workers));
  for (int w = 0; w < workers; ++w) {
    caches.emplace_back(cache_capacity);
  }

  return process_slices(
      depth,
      [&](size_t i, int worker) {
        const cv::Mat normalized = image::normalize_to_u8(volume.slice(i), stats);
        return image::enhance_slice(normalized, params,
                                    caches[static_cast<size_t>(worker)]);
      },
      workers, progress);
}

} // namespace tomo_preview::pipeline
