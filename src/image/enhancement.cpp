#include "tomo_preview/image/enhancement.hpp"
#include "tomo_preview/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace tomo_preview::image {

EnhancementParams adapt_enhancement_params(const EnhancementParams &base,
                                           const GlobalStats &stats) {
  EnhancementParams p = base;
  const double range = static_cast<double>(stats.max) - static_cast<double>(stats.min);
  if (range < 1000.0) {
    p.clip_limit = std::clamp(base.clip_limit, 1.0, 5.0);
  } else if (range < 10000.0) {
    p.clip_limit = std::clamp(base.clip_limit * 2.0, 5.0, 50.0);
  } else {
    p.clip_limit = std::clamp(base.clip_limit * 10.0, 30.0, 1000.0);
  }
  return p;
}

ClaheCache::ClaheCache(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

cv::Ptr<cv::CLAHE> ClaheCache::get(const EnhancementParams &params) {
  const Key key{params.clip_limit, params.tile_grid_size};
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    return it->second;
  }

  if (entries_.size() >= capacity_) {
    entries_.erase(order_.front());
    order_.pop_front();
  }
  cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(
      params.clip_limit, cv::Size(params.tile_grid_size, params.tile_grid_size));
  entries_.emplace(key, clahe);
  order_.push_back(key);
  return clahe;
}

void validate_enhancement_params(const EnhancementParams &params) {
  if (!(params.clip_limit > 0.0) || !std::isfinite(params.clip_limit)) {
    throw ValidationError("clip limit must be > 0");
  }
  if (params.tile_grid_size < 1) {
    throw ValidationError("tile grid size must be >= 1");
  }
}

cv::Mat enhance_slice(const cv::Mat &slice_u8, const EnhancementParams &params,
                      ClaheCache &cache) {
  if (slice_u8.empty()) {
    throw ValidationError("cannot enhance an empty slice");
  }
  if (slice_u8.type() != CV_8UC1) {
    throw ValidationError("enhancement expects an 8-bit single-channel slice");
  }
  validate_enhancement_params(params);

  cv::Mat out;
  cache.get(params)->apply(slice_u8, out);
  return out;
}

cv::Mat enhance_slice(const cv::Mat &slice_u8, const EnhancementParams &params) {
  ClaheCache cache(1);
  return enhance_slice(slice_u8, params, cache);
}

} // namespace tomo_preview::image
