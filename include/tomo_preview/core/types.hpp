#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace tomo_preview {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;

// On-disk sample type of a volume
enum class SampleType {
    INT8,
    INT16,
    FLOAT32,
    UINT16,
    FLOAT16
};

inline size_t sample_type_size(SampleType type) {
    switch (type) {
        case SampleType::INT8: return 1;
        case SampleType::INT16: return 2;
        case SampleType::FLOAT32: return 4;
        case SampleType::UINT16: return 2;
        case SampleType::FLOAT16: return 2;
        default: return 0;
    }
}

inline std::string sample_type_to_string(SampleType type) {
    switch (type) {
        case SampleType::INT8: return "int8";
        case SampleType::INT16: return "int16";
        case SampleType::FLOAT32: return "float32";
        case SampleType::UINT16: return "uint16";
        case SampleType::FLOAT16: return "float16";
        default: return "unknown";
    }
}

// Playback direction of the encoded video
enum class PlaybackMode {
    FORWARD,
    FORWARD_BACKWARD
};

inline std::string playback_mode_to_string(PlaybackMode mode) {
    switch (mode) {
        case PlaybackMode::FORWARD: return "forward";
        case PlaybackMode::FORWARD_BACKWARD: return "forward-backward";
        default: return "unknown";
    }
}

inline std::optional<PlaybackMode> string_to_playback_mode(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "forward") return PlaybackMode::FORWARD;
    if (norm == "forward-backward" || norm == "forward_backward") {
        return PlaybackMode::FORWARD_BACKWARD;
    }
    return std::nullopt;
}

// Discard by absolute slice indices: keep [start, end)
struct IndexRange {
    int start;
    int end;
};

// Discard by fraction trimmed from each end, both in [0, 1)
struct FractionRange {
    double start;
    double end;
};

// Half-open slice interval [start, end)
struct SliceRange {
    size_t start;
    size_t end;

    size_t size() const { return end - start; }
};

// Volume-wide sample extrema, computed once per run
struct GlobalStats {
    float min = 0.0f;
    float max = 0.0f;

    float range() const { return max - min; }
};

struct EnhancementParams {
    double clip_limit = 2.0;
    int tile_grid_size = 8;
};

struct OutputSpec {
    double fps = 30.0;
    std::string codec = "MJPG";
    PlaybackMode playback = PlaybackMode::FORWARD_BACKWARD;
    std::optional<int> max_dimension;  // never upscales
    bool save_png = false;
    bool write_video = true;
    std::string video_extension = ".avi";
    int png_compression = 6;
    int png_writers = 0;               // 0 = auto
};

// Per-volume pipeline phases
enum class Phase {
    READ = 0,
    SELECT = 1,
    STATS = 2,
    ENHANCE = 3,
    PNG_EXPORT = 4,
    VIDEO_ENCODE = 5,
    DONE = 6
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::READ: return "READ";
        case Phase::SELECT: return "SELECT";
        case Phase::STATS: return "STATS";
        case Phase::ENHANCE: return "ENHANCE";
        case Phase::PNG_EXPORT: return "PNG_EXPORT";
        case Phase::VIDEO_ENCODE: return "VIDEO_ENCODE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace tomo_preview
