#pragma once

#include "tomo_preview/core/types.hpp"
#include "tomo_preview/core/volume.hpp"

#include <opencv2/core.hpp>

namespace tomo_preview::image {

// Min/max over every sample of the volume. NaN samples are skipped; a volume
// without finite samples yields (0, 0).
GlobalStats compute_global_stats(const Volume &volume);

// Maps a slice into [0, 255] with the volume-wide stats:
//   out = round(clamp((in - min) / max(max - min, eps) * 255, 0, 255))
// A constant volume (max == min) maps to all zeros. Returns CV_8UC1.
cv::Mat normalize_to_u8(const Matrix2Df &slice, const GlobalStats &stats);

} // namespace tomo_preview::image
