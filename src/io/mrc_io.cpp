#include "tomo_preview/io/mrc_io.hpp"
#include "tomo_preview/core/errors.hpp"
#include "tomo_preview/core/utils.hpp"
#include "tomo_preview/io/mapped_file.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <limits>
#include <memory>

namespace tomo_preview::io {

namespace {

// Word offsets (bytes) in the 1024-byte MRC2014 main header
constexpr size_t kOffNx = 0;
constexpr size_t kOffMode = 12;
constexpr size_t kOffMx = 28;
constexpr size_t kOffCella = 40;
constexpr size_t kOffMapc = 64;
constexpr size_t kOffDmin = 76;
constexpr size_t kOffIspg = 88;
constexpr size_t kOffNsymbt = 92;
constexpr size_t kOffExttyp = 104;
constexpr size_t kOffNversion = 108;
constexpr size_t kOffMap = 208;
constexpr size_t kOffMachst = 212;
constexpr size_t kOffRms = 216;
constexpr size_t kOffNlabl = 220;
constexpr size_t kOffLabels = 224;
constexpr size_t kLabelBytes = 80;
constexpr int kMaxLabels = 10;

template <typename T>
T read_word(const uint8_t* header, size_t offset, bool swap) {
    unsigned char buf[sizeof(T)];
    std::memcpy(buf, header + offset, sizeof(T));
    if (swap) {
        std::reverse(buf, buf + sizeof(T));
    }
    T v;
    std::memcpy(&v, buf, sizeof(T));
    return v;
}

template <typename T>
void write_word(uint8_t* header, size_t offset, T value) {
    std::memcpy(header + offset, &value, sizeof(T));
}

bool host_is_big_endian() {
    const uint16_t marker = 0x0102;
    uint8_t first;
    std::memcpy(&first, &marker, 1);
    return first == 0x01;
}

std::optional<SampleType> sample_type_for_mode(int mode) {
    switch (mode) {
        case 0: return SampleType::INT8;
        case 1: return SampleType::INT16;
        case 2: return SampleType::FLOAT32;
        case 6: return SampleType::UINT16;
        case 12: return SampleType::FLOAT16;
        default: return std::nullopt;
    }
}

} // namespace

uint64_t MrcHeader::data_bytes() const {
    return static_cast<uint64_t>(nx) * static_cast<uint64_t>(ny) *
           static_cast<uint64_t>(nz) * sample_type_size(sample_type);
}

float MrcHeader::voxel_size() const {
    if (mx <= 0 || !(cell_x > 0.0f)) return 0.0f;
    return cell_x / static_cast<float>(mx);
}

std::string memory_verdict_to_string(MemoryVerdict verdict) {
    switch (verdict) {
        case MemoryVerdict::SAFE: return "safe";
        case MemoryVerdict::LARGE: return "large";
        case MemoryVerdict::CRITICAL: return "critical";
        default: return "unknown";
    }
}

bool is_mrc_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".mrc" || ext == ".st" || ext == ".rec" || ext == ".ali" ||
           ext == ".map" || ext == ".mrcs";
}

MrcHeader parse_mrc_header(const uint8_t* data, size_t file_size, const std::string& source) {
    if (file_size < kMrcHeaderBytes) {
        throw ReadError("File too small for an MRC header: " + source);
    }

    const char* map_id = reinterpret_cast<const char*>(data + kOffMap);
    if (std::memcmp(map_id, "MAP ", 4) != 0 && std::memcmp(map_id, "MAP\0", 4) != 0) {
        throw ReadError("Missing MRC map identifier: " + source);
    }

    MrcHeader h;
    // Machine stamp 0x11 0x11 marks big-endian data; anything else is
    // treated as little-endian.
    const bool file_big_endian = data[kOffMachst] == 0x11;
    const bool swap = file_big_endian != host_is_big_endian();
    h.big_endian = file_big_endian;

    h.nx = read_word<int32_t>(data, kOffNx, swap);
    h.ny = read_word<int32_t>(data, kOffNx + 4, swap);
    h.nz = read_word<int32_t>(data, kOffNx + 8, swap);
    h.mode = read_word<int32_t>(data, kOffMode, swap);
    h.mx = read_word<int32_t>(data, kOffMx, swap);
    h.my = read_word<int32_t>(data, kOffMx + 4, swap);
    h.mz = read_word<int32_t>(data, kOffMx + 8, swap);
    h.cell_x = read_word<float>(data, kOffCella, swap);
    h.cell_y = read_word<float>(data, kOffCella + 4, swap);
    h.cell_z = read_word<float>(data, kOffCella + 8, swap);
    h.dmin = read_word<float>(data, kOffDmin, swap);
    h.dmax = read_word<float>(data, kOffDmin + 4, swap);
    h.dmean = read_word<float>(data, kOffDmin + 8, swap);
    h.ispg = read_word<int32_t>(data, kOffIspg, swap);
    h.nsymbt = read_word<int32_t>(data, kOffNsymbt, swap);
    h.rms = read_word<float>(data, kOffRms, swap);

    const int nlabl = std::clamp(read_word<int32_t>(data, kOffNlabl, swap), 0, kMaxLabels);
    for (int i = 0; i < nlabl; ++i) {
        const char* label = reinterpret_cast<const char*>(data + kOffLabels + i * kLabelBytes);
        std::string text(label, strnlen(label, kLabelBytes));
        h.labels.push_back(core::trim(text));
    }

    if (h.nx <= 0 || h.ny <= 0 || h.nz <= 0) {
        throw ReadError("Invalid MRC dimensions " + std::to_string(h.nx) + "x" +
                        std::to_string(h.ny) + "x" + std::to_string(h.nz) + ": " + source);
    }
    if (h.nsymbt < 0) {
        throw ReadError("Negative extended header size: " + source);
    }

    auto type = sample_type_for_mode(h.mode);
    if (!type) {
        throw ReadError("Unsupported MRC mode " + std::to_string(h.mode) + ": " + source);
    }
    h.sample_type = *type;

    // Volume stacks (space groups 401-630) carry a fourth axis.
    if (h.ispg >= 401 && h.ispg <= 630 && h.mz > 0 && h.nz / h.mz > 1) {
        throw ReadError("Volume stacks (4-D data) are not supported: " + source);
    }

    const uint64_t needed = static_cast<uint64_t>(h.data_offset()) + h.data_bytes();
    if (needed > static_cast<uint64_t>(file_size)) {
        throw ReadError("Truncated MRC file (" + std::to_string(file_size) + " of " +
                        std::to_string(needed) + " bytes): " + source);
    }

    return h;
}

MrcHeader read_mrc_header(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ReadError("Cannot open file: " + path.string());
    }

    uint8_t header[kMrcHeaderBytes] = {};
    file.read(reinterpret_cast<char*>(header), kMrcHeaderBytes);
    if (file.gcount() != static_cast<std::streamsize>(kMrcHeaderBytes)) {
        throw ReadError("File too small for an MRC header: " + path.string());
    }

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw ReadError("Cannot stat " + path.string() + ": " + ec.message());
    }
    return parse_mrc_header(header, static_cast<size_t>(size), path.string());
}

Volume open_volume(const fs::path& path, MrcHeader* header_out) {
    auto mapping = std::make_shared<MappedFile>(path);
    MrcHeader h = parse_mrc_header(mapping->data(), mapping->size(), path.string());

    const uint8_t* samples = mapping->data() + h.data_offset();
    const bool swap = h.big_endian != host_is_big_endian();
    Volume volume(std::move(mapping), samples, h.sample_type, swap,
                  static_cast<size_t>(h.nz), h.ny, h.nx);

    if (header_out) {
        *header_out = std::move(h);
    }
    return volume;
}

void write_mrc_volume(const fs::path& path, const std::vector<Matrix2Df>& slices,
                      float voxel_size) {
    if (slices.empty()) {
        throw ValidationError("Cannot write an empty volume: " + path.string());
    }
    if (host_is_big_endian()) {
        throw IOError("Writing MRC files is only supported on little-endian hosts");
    }
    const int nx = static_cast<int>(slices.front().cols());
    const int ny = static_cast<int>(slices.front().rows());
    const int nz = static_cast<int>(slices.size());

    float dmin = std::numeric_limits<float>::max();
    float dmax = std::numeric_limits<float>::lowest();
    double sum = 0.0;
    double sum_sq = 0.0;
    for (const auto& s : slices) {
        if (s.cols() != nx || s.rows() != ny) {
            throw ValidationError("All slices of a volume must share one shape");
        }
        dmin = std::min(dmin, s.minCoeff());
        dmax = std::max(dmax, s.maxCoeff());
        sum += s.cast<double>().sum();
        sum_sq += s.cast<double>().squaredNorm();
    }
    const double count = static_cast<double>(nx) * ny * nz;
    const double mean = sum / count;
    const double rms = std::sqrt(std::max(0.0, sum_sq / count - mean * mean));

    uint8_t header[kMrcHeaderBytes] = {};
    write_word<int32_t>(header, kOffNx, nx);
    write_word<int32_t>(header, kOffNx + 4, ny);
    write_word<int32_t>(header, kOffNx + 8, nz);
    write_word<int32_t>(header, kOffMode, 2);
    write_word<int32_t>(header, kOffMx, nx);
    write_word<int32_t>(header, kOffMx + 4, ny);
    write_word<int32_t>(header, kOffMx + 8, nz);
    write_word<float>(header, kOffCella, voxel_size * nx);
    write_word<float>(header, kOffCella + 4, voxel_size * ny);
    write_word<float>(header, kOffCella + 8, voxel_size * nz);
    write_word<float>(header, kOffCella + 12, 90.0f);
    write_word<float>(header, kOffCella + 16, 90.0f);
    write_word<float>(header, kOffCella + 20, 90.0f);
    write_word<int32_t>(header, kOffMapc, 1);
    write_word<int32_t>(header, kOffMapc + 4, 2);
    write_word<int32_t>(header, kOffMapc + 8, 3);
    write_word<float>(header, kOffDmin, dmin);
    write_word<float>(header, kOffDmin + 4, dmax);
    write_word<float>(header, kOffDmin + 8, static_cast<float>(mean));
    write_word<int32_t>(header, kOffIspg, nz > 1 ? 401 : 1);
    write_word<int32_t>(header, kOffNsymbt, 0);
    write_word<int32_t>(header, kOffNversion, 20140);
    std::memcpy(header + kOffExttyp, "    ", 4);
    std::memcpy(header + kOffMap, "MAP ", 4);
    header[kOffMachst] = 0x44;
    header[kOffMachst + 1] = 0x44;
    write_word<float>(header, kOffRms, static_cast<float>(rms));
    write_word<int32_t>(header, kOffNlabl, 1);
    const char label[] = "tomo_preview";
    std::memcpy(header + kOffLabels, label, sizeof(label) - 1);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("Cannot create file: " + path.string());
    }
    out.write(reinterpret_cast<const char*>(header), kMrcHeaderBytes);
    for (const auto& s : slices) {
        out.write(reinterpret_cast<const char*>(s.data()),
                  static_cast<std::streamsize>(s.size() * sizeof(float)));
    }
    if (!out) {
        throw IOError("Cannot write MRC data: " + path.string());
    }
}

MemoryEstimate estimate_memory(const MrcHeader& header, uint64_t warn_bytes) {
    MemoryEstimate est;
    est.raw_bytes = header.data_bytes();
    est.processing_bytes = static_cast<uint64_t>(static_cast<double>(est.raw_bytes) * 2.5);
    if (est.processing_bytes > 2 * warn_bytes) {
        est.verdict = MemoryVerdict::CRITICAL;
    } else if (est.processing_bytes > warn_bytes) {
        est.verdict = MemoryVerdict::LARGE;
    } else {
        est.verdict = MemoryVerdict::SAFE;
    }
    return est;
}

} // namespace tomo_preview::io
