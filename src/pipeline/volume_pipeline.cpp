#include "tomo_preview/pipeline/volume_pipeline.hpp"
#include "tomo_preview/core/errors.hpp"
#include "tomo_preview/core/utils.hpp"
#include "tomo_preview/image/enhancement.hpp"
#include "tomo_preview/image/normalization.hpp"
#include "tomo_preview/image/slice_selection.hpp"
#include "tomo_preview/io/frame_output.hpp"
#include "tomo_preview/io/mrc_io.hpp"
#include "tomo_preview/pipeline/slice_pipeline.hpp"

#include <algorithm>
#include <deque>
#include <memory>

namespace tomo_preview::pipeline {

namespace {

void log_line(core::EventEmitter &emitter, Phase phase, const std::string &volume,
              const std::string &msg) {
  emitter.log("[" + phase_to_string(phase) + "] " + volume + ": " + msg);
}

// Emits roughly every 10% so large volumes do not flood the event log.
ProgressFn throttled_progress(core::EventEmitter &emitter, const std::string &volume,
                              Phase phase) {
  auto last = std::make_shared<size_t>(0);
  return [&emitter, volume, phase, last](size_t done, size_t total) {
    const size_t step = std::max<size_t>(1, total / 10);
    if (done <= *last) {
      return;
    }
    if (done == total || done - *last >= step) {
      *last = done;
      emitter.phase_progress(volume, phase, done, total);
    }
  };
}

VolumeResult fail(VolumeResult result, VolumeStatus status, Phase stage,
                  const std::string &message) {
  result.status = status;
  result.stage = stage;
  result.message = message;
  return result;
}

} // namespace

std::string volume_status_to_string(VolumeStatus status) {
  switch (status) {
  case VolumeStatus::Ok:
    return "ok";
  case VolumeStatus::ReadFailed:
    return "read_failed";
  case VolumeStatus::RangeFailed:
    return "range_failed";
  case VolumeStatus::SliceFailed:
    return "slice_failed";
  case VolumeStatus::EncodeFailed:
    return "encode_failed";
  case VolumeStatus::Failed:
    return "failed";
  default:
    return "unknown";
  }
}

core::json VolumeResult::to_json() const {
  core::json j;
  j["input"] = input.string();
  j["status"] = volume_status_to_string(status);
  j["stage"] = phase_to_string(stage);
  j["message"] = message;
  j["frames"] = frames;
  j["video"] = video ? core::json(video->string()) : core::json(nullptr);
  j["png_written"] = png_files.size();
  j["png_failures"] = png_failures;
  return j;
}

VolumeResult run_volume(const VolumeJob &job, core::EventEmitter &emitter) {
  const std::string name = job.input.filename().string();
  const std::string base = job.input.stem().string();

  VolumeResult result;
  result.input = job.input;
  Phase phase = Phase::READ;

  try {
    // READ
    emitter.phase_start(name, phase);
    io::MrcHeader header;
    Volume volume = io::open_volume(job.input, &header);
    const io::MemoryEstimate estimate =
        io::estimate_memory(header, job.memory_warn_bytes);
    log_line(emitter, phase, name,
             std::to_string(header.nx) + "x" + std::to_string(header.ny) + "x" +
                 std::to_string(header.nz) + " " +
                 sample_type_to_string(header.sample_type) + ", " +
                 core::format_bytes(estimate.raw_bytes));
    if (estimate.raw_bytes > job.read_warn_bytes) {
      emitter.warning(name, "large file: " + core::format_bytes(estimate.raw_bytes));
    }
    if (estimate.verdict != io::MemoryVerdict::SAFE) {
      emitter.warning(name, "estimated processing memory " +
                                core::format_bytes(estimate.processing_bytes) + " (" +
                                io::memory_verdict_to_string(estimate.verdict) + ")");
    }
    emitter.phase_end(name, phase, "ok",
                      {{"depth", volume.depth()},
                       {"height", volume.height()},
                       {"width", volume.width()},
                       {"mode", header.mode}});

    // SELECT
    phase = Phase::SELECT;
    emitter.phase_start(name, phase);
    volume = image::select_slices(volume, job.index_range, job.fraction_range);
    log_line(emitter, phase, name, "keeping " + std::to_string(volume.depth()) + " slices");
    emitter.phase_end(name, phase, "ok", {{"slices", volume.depth()}});

    // STATS
    phase = Phase::STATS;
    emitter.phase_start(name, phase);
    const GlobalStats stats = image::compute_global_stats(volume);
    EnhancementParams params = job.enhancement;
    if (job.adaptive_clip) {
      params = image::adapt_enhancement_params(params, stats);
    }
    log_line(emitter, phase, name,
             "min=" + std::to_string(stats.min) + " max=" + std::to_string(stats.max) +
                 " clip=" + std::to_string(params.clip_limit));
    emitter.phase_end(name, phase, "ok",
                      {{"min", stats.min},
                       {"max", stats.max},
                       {"clip_limit", params.clip_limit},
                       {"tile_grid_size", params.tile_grid_size}});

    // ENHANCE
    phase = Phase::ENHANCE;
    emitter.phase_start(name, phase);
    std::vector<cv::Mat> frames =
        process_volume(volume, stats, params, job.workers,
                       throttled_progress(emitter, name, phase), job.cache_size);
    result.frames = frames.size();
    log_line(emitter, phase, name, std::to_string(frames.size()) + " frames");
    emitter.phase_end(name, phase, "ok", {{"frames", frames.size()}});

    // PNG_EXPORT
    if (job.output.save_png) {
      phase = Phase::PNG_EXPORT;
      emitter.phase_start(name, phase);
      io::PngExportResult png = io::write_png_sequence(
          frames, job.output_dir, base, job.output.max_dimension,
          job.output.png_compression, job.output.png_writers);
      result.png_files = png.written;
      result.png_failures = png.failures.size();
      for (const auto &f : png.failures) {
        emitter.warning(name, "PNG " + std::to_string(f.index) + ": " + f.message);
      }
      log_line(emitter, phase, name,
               std::to_string(png.written.size()) + " written to " +
                   png.directory.string());
      emitter.phase_end(name, phase, png.failures.empty() ? "ok" : "partial",
                        {{"written", png.written.size()},
                         {"failed", png.failures.size()}});
    }

    // VIDEO_ENCODE
    if (job.output.write_video) {
      phase = Phase::VIDEO_ENCODE;
      emitter.phase_start(name, phase);
      const fs::path video = job.output_dir / (base + job.output.video_extension);
      io::write_video(video, frames, job.output);
      result.video = video;
      log_line(emitter, phase, name, video.string());
      emitter.phase_end(name, phase, "ok", {{"path", video.string()}});
    }
    result.stage = Phase::DONE;
  } catch (const ReadError &e) {
    result = fail(std::move(result), VolumeStatus::ReadFailed, phase, e.what());
  } catch (const RangeError &e) {
    result = fail(std::move(result), VolumeStatus::RangeFailed, phase, e.what());
  } catch (const SliceProcessingError &e) {
    result = fail(std::move(result), VolumeStatus::SliceFailed, phase, e.what());
  } catch (const EncodeError &e) {
    result = fail(std::move(result), VolumeStatus::EncodeFailed, phase, e.what());
  } catch (const std::exception &e) {
    result = fail(std::move(result), VolumeStatus::Failed, phase, e.what());
  } catch (...) {
    result = fail(std::move(result), VolumeStatus::Failed, phase, "unknown error");
  }

  if (!result.ok()) {
    emitter.phase_end(name, result.stage, "error", {{"error", result.message}});
    emitter.error(name, result.message);
    emitter.log_error("[ERROR] " + name + ": " + result.message);
  }
  emitter.volume_done(name, result.to_json());
  return result;
}

std::future<VolumeResult> run_volume_async(VolumeJob job,
                                           core::EventEmitter &emitter) {
  return std::async(std::launch::async, [job = std::move(job), &emitter]() {
    return run_volume(job, emitter);
  });
}

std::vector<VolumeResult> run_batch(std::vector<VolumeJob> jobs,
                                    int concurrent_volumes,
                                    core::EventEmitter &emitter) {
  const size_t limit = static_cast<size_t>(std::max(1, concurrent_volumes));
  std::vector<VolumeResult> results(jobs.size());
  std::deque<std::pair<size_t, std::future<VolumeResult>>> in_flight;

  for (size_t i = 0; i < jobs.size(); ++i) {
    if (in_flight.size() >= limit) {
      results[in_flight.front().first] = in_flight.front().second.get();
      in_flight.pop_front();
    }
    in_flight.emplace_back(i, run_volume_async(std::move(jobs[i]), emitter));
  }
  while (!in_flight.empty()) {
    results[in_flight.front().first] = in_flight.front().second.get();
    in_flight.pop_front();
  }
  return results;
}

} // namespace tomo_preview::pipeline
