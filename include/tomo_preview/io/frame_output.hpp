#pragma once

#include "tomo_preview/core/types.hpp"
#include "tomo_preview/pipeline/worker_pool.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tomo_preview::io {

// Output size bounded by `max_dimension` on the longer side. Keeps the
// aspect ratio and never upscales.
cv::Size compute_output_size(const cv::Size &native,
                             const std::optional<int> &max_dimension);

// Frame indices in emission order. forward-backward appends
// [n-2, ..., 1]; a single frame is emitted once in either mode.
std::vector<size_t> playback_order(size_t frame_count, PlaybackMode mode);

// Resizes every frame to `size` (area interpolation). Frames already at
// `size` are shared, not copied.
std::vector<cv::Mat> resize_frames(const std::vector<cv::Mat> &frames,
                                   const cv::Size &size);

// Encodes grayscale frames into one video. Throws EncodeError when the
// codec is malformed or the container cannot be opened or written.
void write_video(const fs::path &path, const std::vector<cv::Mat> &frames,
                 const OutputSpec &spec);

struct PngExportResult {
  fs::path directory;
  std::vector<fs::path> written;
  std::vector<pipeline::TaskFailure> failures;
};

fs::path png_frame_path(const fs::path &directory, const std::string &basename,
                        size_t index);

// Writes <output_dir>/<basename>_slices/<basename>_NNNN.png, or
// <output_dir>/<basename>.png for a single frame. Every frame is attempted;
// per-frame failures are returned, not thrown. Throws EncodeError only when
// the output directory cannot be created.
PngExportResult write_png_sequence(const std::vector<cv::Mat> &frames,
                                   const fs::path &output_dir,
                                   const std::string &basename,
                                   const std::optional<int> &max_dimension,
                                   int compression = 6, int writers = 0);

} // namespace tomo_preview::io
