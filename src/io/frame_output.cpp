#include "tomo_preview/io/frame_output.hpp"
#include "tomo_preview/core/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <thread>

namespace tomo_preview::io {

namespace {

constexpr int kMaxPngWriters = 32;

int default_png_writers() {
  const int cores = static_cast<int>(std::thread::hardware_concurrency());
  return std::min(kMaxPngWriters, std::max(1, cores) * 4);
}

} // namespace

cv::Size compute_output_size(const cv::Size &native,
                             const std::optional<int> &max_dimension) {
  if (!max_dimension || *max_dimension <= 0 || native.width <= 0 ||
      native.height <= 0) {
    return native;
  }
  const double longest = static_cast<double>(std::max(native.width, native.height));
  const double scale = std::min(static_cast<double>(*max_dimension) / longest, 1.0);
  if (scale >= 1.0) {
    return native;
  }
  const int w = std::max(1, static_cast<int>(std::floor(native.width * scale)));
  const int h = std::max(1, static_cast<int>(std::floor(native.height * scale)));
  return cv::Size(w, h);
}

std::vector<size_t> playback_order(size_t frame_count, PlaybackMode mode) {
  std::vector<size_t> order;
  order.reserve(frame_count * 2);
  for (size_t i = 0; i < frame_count; ++i) {
    order.push_back(i);
  }
  if (mode == PlaybackMode::FORWARD_BACKWARD && frame_count > 2) {
    for (size_t i = frame_count - 2; i >= 1; --i) {
      order.push_back(i);
    }
  }
  return order;
}

std::vector<cv::Mat> resize_frames(const std::vector<cv::Mat> &frames,
                                   const cv::Size &size) {
  std::vector<cv::Mat> out;
  out.reserve(frames.size());
  for (const auto &f : frames) {
    if (f.size() == size) {
      out.push_back(f);
      continue;
    }
    cv::Mat resized;
    cv::resize(f, resized, size, 0.0, 0.0, cv::INTER_AREA);
    out.push_back(resized);
  }
  return out;
}

void write_video(const fs::path &path, const std::vector<cv::Mat> &frames,
                 const OutputSpec &spec) {
  if (frames.empty()) {
    throw EncodeError("No frames to encode for " + path.string());
  }
  if (spec.codec.size() != 4) {
    throw EncodeError("Codec must be a 4-character code, got '" + spec.codec + "'");
  }
  if (!(spec.fps > 0.0)) {
    throw EncodeError("Frame rate must be > 0");
  }

  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw EncodeError("Cannot create output directory " +
                        path.parent_path().string() + ": " + ec.message());
    }
  }

  const cv::Size size = compute_output_size(frames.front().size(), spec.max_dimension);
  const std::vector<cv::Mat> scaled = resize_frames(frames, size);
  const int fourcc = cv::VideoWriter::fourcc(spec.codec[0], spec.codec[1],
                                             spec.codec[2], spec.codec[3]);

  try {
    cv::VideoWriter writer(path.string(), fourcc, spec.fps, size, false);
    if (!writer.isOpened()) {
      throw EncodeError("Failed to open video writer for " + path.string() +
                        " (codec " + spec.codec + ")");
    }
    for (size_t idx : playback_order(scaled.size(), spec.playback)) {
      writer.write(scaled[idx]);
    }
    writer.release();
  } catch (const cv::Exception &e) {
    throw EncodeError("OpenCV failed writing " + path.string() + ": " + e.what());
  }
}

fs::path png_frame_path(const fs::path &directory, const std::string &basename,
                        size_t index) {
  std::ostringstream name;
  name << basename << '_' << std::setfill('0') << std::setw(4) << index << ".png";
  return directory / name.str();
}

PngExportResult write_png_sequence(const std::vector<cv::Mat> &frames,
                                   const fs::path &output_dir,
                                   const std::string &basename,
                                   const std::optional<int> &max_dimension,
                                   int compression, int writers) {
  PngExportResult result;
  if (frames.empty()) {
    return result;
  }

  const bool single = frames.size() == 1;
  result.directory = single ? output_dir : output_dir / (basename + "_slices");
  std::error_code ec;
  fs::create_directories(result.directory, ec);
  if (ec) {
    throw EncodeError("Cannot create PNG directory " + result.directory.string() +
                      ": " + ec.message());
  }

  const cv::Size size = compute_output_size(frames.front().size(), max_dimension);
  const std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION,
                                   std::clamp(compression, 0, 9)};

  std::vector<fs::path> paths(frames.size());
  std::vector<uint8_t> ok(frames.size(), 0);
  const int pool = pipeline::resolve_worker_count(
      writers > 0 ? writers : default_png_writers(), frames.size(), kMaxPngWriters);

  result.failures = pipeline::run_indexed_tasks(
      frames.size(), pool, [&](size_t i, int) {
        paths[i] = single ? result.directory / (basename + ".png")
                          : png_frame_path(result.directory, basename, i);
        cv::Mat frame = frames[i];
        if (frame.size() != size) {
          cv::resize(frames[i], frame, size, 0.0, 0.0, cv::INTER_AREA);
        }
        if (!cv::imwrite(paths[i].string(), frame, params)) {
          throw EncodeError("Failed to write " + paths[i].string());
        }
        ok[i] = 1;
      });

  for (size_t i = 0; i < frames.size(); ++i) {
    if (ok[i]) {
      result.written.push_back(paths[i]);
    }
  }
  return result;
}

} // namespace tomo_preview::io
