#pragma once

#include "tomo_preview/core/types.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <deque>
#include <map>
#include <utility>

namespace tomo_preview::image {

// Picks the clip limit from the volume's dynamic range:
//   range < 1000   -> clamp(clip, 1, 5)
//   range < 10000  -> clamp(2 * clip, 5, 50)
//   otherwise      -> clamp(10 * clip, 30, 1000)
// The tile grid is kept.
EnhancementParams adapt_enhancement_params(const EnhancementParams &base,
                                           const GlobalStats &stats);

// Configured CLAHE instances keyed by (clip limit, tile grid). Not
// thread-safe: each worker owns one. The oldest entry is evicted when full.
class ClaheCache {
public:
  explicit ClaheCache(size_t capacity = 8);

  cv::Ptr<cv::CLAHE> get(const EnhancementParams &params);

  size_t size() const { return entries_.size(); }
  size_t capacity() const { return capacity_; }

private:
  using Key = std::pair<double, int>;

  size_t capacity_;
  std::map<Key, cv::Ptr<cv::CLAHE>> entries_;
  std::deque<Key> order_;
};

void validate_enhancement_params(const EnhancementParams &params);

// Tile-local histogram equalization with clipped bins, blended across tile
// borders. Input and output are CV_8UC1 of the same size.
cv::Mat enhance_slice(const cv::Mat &slice_u8, const EnhancementParams &params,
                      ClaheCache &cache);

cv::Mat enhance_slice(const cv::Mat &slice_u8, const EnhancementParams &params);

} // namespace tomo_preview::image
