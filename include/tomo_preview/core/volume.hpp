#pragma once

#include "types.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace tomo_preview {

// A (slice, height, width) stack of samples. The samples are either a view
// into a memory-mapped file or an owned float32 buffer; `storage` keeps the
// backing alive for as long as any view references it. Copies and
// sub-volumes share the backing.
class Volume {
public:
    Volume() = default;
    Volume(std::shared_ptr<const void> storage, const uint8_t* data,
           SampleType type, bool byte_swapped, size_t depth, int height, int width);

    // Owned float32 volume; all slices must share one shape.
    static Volume from_slices(const std::vector<Matrix2Df>& slices);

    size_t depth() const { return depth_; }
    int height() const { return height_; }
    int width() const { return width_; }
    SampleType sample_type() const { return type_; }
    bool empty() const { return depth_ == 0; }

    size_t slice_samples() const {
        return static_cast<size_t>(height_) * static_cast<size_t>(width_);
    }
    uint64_t byte_size() const {
        return static_cast<uint64_t>(depth_) * slice_samples() * sample_type_size(type_);
    }

    // Slice i converted to float32.
    Matrix2Df slice(size_t i) const;

    // View of slices [start, end).
    Volume subvolume(size_t start, size_t end) const;

private:
    std::shared_ptr<const void> storage_;
    const uint8_t* data_ = nullptr;
    SampleType type_ = SampleType::FLOAT32;
    bool byte_swapped_ = false;
    size_t depth_ = 0;
    int height_ = 0;
    int width_ = 0;
};

} // namespace tomo_preview
