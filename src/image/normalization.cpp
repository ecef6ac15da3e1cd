#include "tomo_preview/image/normalization.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tomo_preview::image {

GlobalStats compute_global_stats(const Volume &volume) {
  float lo = std::numeric_limits<float>::infinity();
  float hi = -std::numeric_limits<float>::infinity();
  for (size_t z = 0; z < volume.depth(); ++z) {
    const Matrix2Df s = volume.slice(z);
    const float *p = s.data();
    for (Eigen::Index i = 0; i < s.size(); ++i) {
      const float v = p[i];
      if (std::isnan(v))
        continue;
      lo = std::min(lo, v);
      hi = std::max(hi, v);
    }
  }

  GlobalStats stats;
  if (lo <= hi) {
    stats.min = lo;
    stats.max = hi;
  }
  return stats;
}

cv::Mat normalize_to_u8(const Matrix2Df &slice, const GlobalStats &stats) {
  cv::Mat out(static_cast<int>(slice.rows()), static_cast<int>(slice.cols()),
              CV_8UC1, cv::Scalar(0));
  const double range = static_cast<double>(stats.max) - static_cast<double>(stats.min);
  if (!(range > 0.0)) {
    return out;
  }

  constexpr double kEps = 1e-12;
  const double scale = 255.0 / std::max(range, kEps);
  for (int y = 0; y < out.rows; ++y) {
    uint8_t *row = out.ptr<uint8_t>(y);
    for (int x = 0; x < out.cols; ++x) {
      double v = (static_cast<double>(slice(y, x)) - stats.min) * scale;
      // NaN fails both comparisons and ends up at 0.
      if (!(v > 0.0)) {
        v = 0.0;
      } else if (v > 255.0) {
        v = 255.0;
      }
      row[x] = static_cast<uint8_t>(std::lround(v));
    }
  }
  return out;
}

} // namespace tomo_preview::image
