#include "tomo_preview/image/slice_selection.hpp"
#include "tomo_preview/core/errors.hpp"

#include <cmath>
#include <sstream>

namespace tomo_preview::image {

SliceRange resolve_slice_range(size_t depth,
                               const std::optional<IndexRange>& index_range,
                               const std::optional<FractionRange>& fraction_range) {
  if (index_range) {
    const long long start = index_range->start;
    const long long end = index_range->end;
    if (start < 0 || end > static_cast<long long>(depth) || start >= end) {
      std::ostringstream oss;
      oss << "Invalid discard range (" << start << ", " << end
          << ") for depth " << depth;
      throw RangeError(oss.str());
    }
    return {static_cast<size_t>(start), static_cast<size_t>(end)};
  }

  if (fraction_range) {
    const double f_start = fraction_range->start;
    const double f_end = fraction_range->end;
    if (!(f_start >= 0.0 && f_start < 1.0 && f_end >= 0.0 && f_end < 1.0)) {
      std::ostringstream oss;
      oss << "Invalid discard fraction (" << f_start << ", " << f_end
          << "): both must be in [0, 1)";
      throw RangeError(oss.str());
    }
    const double d = static_cast<double>(depth);
    const size_t start = static_cast<size_t>(std::floor(d * f_start));
    const size_t trimmed_end = static_cast<size_t>(std::floor(d * f_end));
    const size_t end = depth - trimmed_end;
    if (start >= end) {
      std::ostringstream oss;
      oss << "Discard fraction (" << f_start << ", " << f_end << ") leaves no slices of "
          << depth;
      throw RangeError(oss.str());
    }
    return {start, end};
  }

  return {0, depth};
}

Volume select_slices(const Volume& volume,
                     const std::optional<IndexRange>& index_range,
                     const std::optional<FractionRange>& fraction_range) {
  const SliceRange r =
      resolve_slice_range(volume.depth(), index_range, fraction_range);
  if (r.start == 0 && r.end == volume.depth()) {
    return volume;
  }
  return volume.subvolume(r.start, r.end);
}

} // namespace tomo_preview::image
