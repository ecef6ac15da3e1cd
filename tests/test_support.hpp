#pragma once

#include "tomo_preview/core/types.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <vector>

namespace tomo_preview::test {

// Unique scratch directory, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// depth slices of h x w; sample (z, y, x) = z * 1000 + y * w + x
std::vector<Matrix2Df> ramp_slices(size_t depth, int h, int w);

struct RawMrcSpec {
    int nx = 4;
    int ny = 3;
    int nz = 2;
    int mode = 2;
    bool big_endian = false;
    int ispg = 0;
    int mz = 0;
    int nsymbt = 0;
};

std::vector<uint8_t> make_mrc_header(const RawMrcSpec& spec);

void write_bytes(const fs::path& path, const std::vector<uint8_t>& header,
                 const std::vector<uint8_t>& payload);

// Appends `value` to `out`, byte-reversed when `big_endian` is set.
template <typename T>
void append_sample(std::vector<uint8_t>& out, T value, bool big_endian) {
    uint8_t buf[sizeof(T)];
    std::memcpy(buf, &value, sizeof(T));
    if (big_endian) {
        std::reverse(buf, buf + sizeof(T));
    }
    out.insert(out.end(), buf, buf + sizeof(T));
}

} // namespace tomo_preview::test
