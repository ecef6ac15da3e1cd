#pragma once

#include "tomo_preview/core/types.hpp"
#include "tomo_preview/core/volume.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tomo_preview::io {

constexpr size_t kMrcHeaderBytes = 1024;

struct MrcHeader {
    int nx = 0;              // columns (width)
    int ny = 0;              // rows (height)
    int nz = 0;              // sections (depth)
    int mode = 0;
    int mx = 0;
    int my = 0;
    int mz = 0;
    float cell_x = 0.0f;     // Angstrom
    float cell_y = 0.0f;
    float cell_z = 0.0f;
    float dmin = 0.0f;
    float dmax = 0.0f;
    float dmean = 0.0f;
    float rms = 0.0f;
    int ispg = 0;
    int nsymbt = 0;          // extended header bytes
    bool big_endian = false;
    SampleType sample_type = SampleType::FLOAT32;
    std::vector<std::string> labels;

    size_t data_offset() const { return kMrcHeaderBytes + static_cast<size_t>(nsymbt); }
    uint64_t data_bytes() const;
    // Pixel spacing along x in Angstrom, 0 when the cell is unset.
    float voxel_size() const;
};

enum class MemoryVerdict {
    SAFE,
    LARGE,
    CRITICAL
};

struct MemoryEstimate {
    uint64_t raw_bytes = 0;
    uint64_t processing_bytes = 0;   // raw plus float and 8-bit working copies
    MemoryVerdict verdict = MemoryVerdict::SAFE;
};

std::string memory_verdict_to_string(MemoryVerdict verdict);

bool is_mrc_path(const fs::path& path);

// Parses and validates a main header. `file_size` is checked against the
// declared data size. Throws ReadError.
MrcHeader parse_mrc_header(const uint8_t* data, size_t file_size, const std::string& source);

MrcHeader read_mrc_header(const fs::path& path);

// Memory-maps the file; samples are decoded slice by slice on access.
// A 2-D image becomes a depth-1 volume. Throws ReadError.
Volume open_volume(const fs::path& path, MrcHeader* header_out = nullptr);

// Writes a float32 (mode 2) little-endian MRC file.
void write_mrc_volume(const fs::path& path, const std::vector<Matrix2Df>& slices,
                      float voxel_size = 1.0f);

MemoryEstimate estimate_memory(const MrcHeader& header, uint64_t warn_bytes);

} // namespace tomo_preview::io
