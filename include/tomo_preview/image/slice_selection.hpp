#pragma once

#include "tomo_preview/core/types.hpp"
#include "tomo_preview/core/volume.hpp"

#include <optional>

namespace tomo_preview::image {

// Resolves the slices to keep. The index range wins when both are given;
// with neither the whole volume [0, depth) is kept. Throws RangeError.
SliceRange resolve_slice_range(size_t depth,
                               const std::optional<IndexRange>& index_range,
                               const std::optional<FractionRange>& fraction_range);

// View of the kept slices; shares the volume's backing.
Volume select_slices(const Volume& volume,
                     const std::optional<IndexRange>& index_range,
                     const std::optional<FractionRange>& fraction_range);

} // namespace tomo_preview::image
