#include "tomo_preview/core/volume.hpp"
#include "tomo_preview/core/errors.hpp"

#include <algorithm>
#include <cstring>

namespace tomo_preview {

namespace {

template <typename T>
T load_sample(const uint8_t* src, bool swap) {
    unsigned char buf[sizeof(T)];
    std::memcpy(buf, src, sizeof(T));
    if (swap) {
        std::reverse(buf, buf + sizeof(T));
    }
    T v;
    std::memcpy(&v, buf, sizeof(T));
    return v;
}

template <typename T>
void convert_samples(const uint8_t* src, size_t n, bool swap, float* dst) {
    for (size_t i = 0; i < n; ++i) {
        dst[i] = static_cast<float>(load_sample<T>(src + i * sizeof(T), swap));
    }
}

void convert_half_samples(const uint8_t* src, size_t n, bool swap, float* dst) {
    for (size_t i = 0; i < n; ++i) {
        const uint16_t bits = load_sample<uint16_t>(src + i * 2, swap);
        dst[i] = static_cast<float>(Eigen::numext::bit_cast<Eigen::half>(bits));
    }
}

} // namespace

Volume::Volume(std::shared_ptr<const void> storage, const uint8_t* data,
               SampleType type, bool byte_swapped, size_t depth, int height, int width)
    : storage_(std::move(storage)), data_(data), type_(type),
      byte_swapped_(byte_swapped), depth_(depth), height_(height), width_(width) {}

Volume Volume::from_slices(const std::vector<Matrix2Df>& slices) {
    if (slices.empty()) {
        return Volume();
    }
    const int h = static_cast<int>(slices.front().rows());
    const int w = static_cast<int>(slices.front().cols());
    const size_t n = static_cast<size_t>(h) * static_cast<size_t>(w);

    auto buffer = std::make_shared<std::vector<float>>(slices.size() * n);
    for (size_t z = 0; z < slices.size(); ++z) {
        if (slices[z].rows() != h || slices[z].cols() != w) {
            throw ValidationError("All slices of a volume must share one shape");
        }
        std::memcpy(buffer->data() + z * n, slices[z].data(), n * sizeof(float));
    }

    const auto* data = reinterpret_cast<const uint8_t*>(buffer->data());
    return Volume(std::move(buffer), data, SampleType::FLOAT32, false,
                  slices.size(), h, w);
}

Matrix2Df Volume::slice(size_t i) const {
    if (i >= depth_) {
        throw ValidationError("Slice index " + std::to_string(i) +
                              " out of range for depth " + std::to_string(depth_));
    }
    const size_t n = slice_samples();
    const uint8_t* src = data_ + i * n * sample_type_size(type_);

    Matrix2Df out(height_, width_);
    float* dst = out.data();
    switch (type_) {
        case SampleType::INT8:
            convert_samples<int8_t>(src, n, false, dst);
            break;
        case SampleType::INT16:
            convert_samples<int16_t>(src, n, byte_swapped_, dst);
            break;
        case SampleType::FLOAT32:
            convert_samples<float>(src, n, byte_swapped_, dst);
            break;
        case SampleType::UINT16:
            convert_samples<uint16_t>(src, n, byte_swapped_, dst);
            break;
        case SampleType::FLOAT16:
            convert_half_samples(src, n, byte_swapped_, dst);
            break;
    }
    return out;
}

Volume Volume::subvolume(size_t start, size_t end) const {
    if (start > end || end > depth_) {
        throw ValidationError("Invalid sub-volume [" + std::to_string(start) + ", " +
                              std::to_string(end) + ") of depth " + std::to_string(depth_));
    }
    const size_t offset = start * slice_samples() * sample_type_size(type_);
    return Volume(storage_, data_ + offset, type_, byte_swapped_, end - start,
                  height_, width_);
}

} // namespace tomo_preview
