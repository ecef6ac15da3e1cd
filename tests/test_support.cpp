#include "test_support.hpp"

#include <atomic>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace tomo_preview::test {

namespace {

template <typename T>
void put(std::vector<uint8_t>& header, size_t offset, T value, bool big_endian) {
    std::vector<uint8_t> bytes;
    append_sample(bytes, value, big_endian);
    std::copy(bytes.begin(), bytes.end(), header.begin() + static_cast<long>(offset));
}

} // namespace

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    std::random_device rd;
    path_ = fs::temp_directory_path() /
            ("tomo_preview_test_" + std::to_string(rd()) + "_" +
             std::to_string(counter.fetch_add(1)));
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::vector<Matrix2Df> ramp_slices(size_t depth, int h, int w) {
    std::vector<Matrix2Df> slices;
    for (size_t z = 0; z < depth; ++z) {
        Matrix2Df s(h, w);
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                s(y, x) = static_cast<float>(z * 1000 + static_cast<size_t>(y * w + x));
            }
        }
        slices.push_back(s);
    }
    return slices;
}

std::vector<uint8_t> make_mrc_header(const RawMrcSpec& spec) {
    const bool be = spec.big_endian;
    std::vector<uint8_t> h(1024, 0);
    put<int32_t>(h, 0, spec.nx, be);
    put<int32_t>(h, 4, spec.ny, be);
    put<int32_t>(h, 8, spec.nz, be);
    put<int32_t>(h, 12, spec.mode, be);
    put<int32_t>(h, 28, spec.nx, be);
    put<int32_t>(h, 32, spec.ny, be);
    put<int32_t>(h, 36, spec.mz > 0 ? spec.mz : spec.nz, be);
    put<float>(h, 40, static_cast<float>(spec.nx) * 2.0f, be);
    put<float>(h, 44, static_cast<float>(spec.ny) * 2.0f, be);
    put<float>(h, 48, static_cast<float>(spec.nz) * 2.0f, be);
    put<int32_t>(h, 88, spec.ispg, be);
    put<int32_t>(h, 92, spec.nsymbt, be);
    h[208] = 'M';
    h[209] = 'A';
    h[210] = 'P';
    h[211] = ' ';
    h[212] = be ? 0x11 : 0x44;
    h[213] = be ? 0x11 : 0x44;
    return h;
}

void write_bytes(const fs::path& path, const std::vector<uint8_t>& header,
                 const std::vector<uint8_t>& payload) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot create " + path.string());
    }
    out.write(reinterpret_cast<const char*>(header.data()),
              static_cast<std::streamsize>(header.size()));
    out.write(reinterpret_cast<const char*>(payload.data()),
              static_cast<std::streamsize>(payload.size()));
}

} // namespace tomo_preview::test
