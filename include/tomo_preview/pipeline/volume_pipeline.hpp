#pragma once

#include "tomo_preview/core/events.hpp"
#include "tomo_preview/core/types.hpp"

#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace tomo_preview::pipeline {

// Everything needed to turn one volume file into its preview outputs.
struct VolumeJob {
  fs::path input;
  fs::path output_dir;
  OutputSpec output;
  EnhancementParams enhancement;
  bool adaptive_clip = false;
  std::optional<IndexRange> index_range;
  std::optional<FractionRange> fraction_range;
  int workers = 0; // 0 = hardware threads
  size_t cache_size = 8;
  uint64_t read_warn_bytes = 2ull << 30;
  uint64_t memory_warn_bytes = 4ull << 30;
};

enum class VolumeStatus {
  Ok,
  ReadFailed,
  RangeFailed,
  SliceFailed,
  EncodeFailed,
  Failed
};

std::string volume_status_to_string(VolumeStatus status);

struct VolumeResult {
  fs::path input;
  VolumeStatus status = VolumeStatus::Ok;
  Phase stage = Phase::DONE; // phase that failed, DONE on success
  std::string message;
  size_t frames = 0;
  std::optional<fs::path> video;
  std::vector<fs::path> png_files;
  size_t png_failures = 0;

  bool ok() const { return status == VolumeStatus::Ok; }
  core::json to_json() const;
};

// Runs READ, SELECT, STATS, ENHANCE, PNG_EXPORT and VIDEO_ENCODE for one
// file. Never throws: every failure is reported in the result.
VolumeResult run_volume(const VolumeJob &job, core::EventEmitter &emitter);

// run_volume on its own thread. `emitter` must outlive the future.
std::future<VolumeResult> run_volume_async(VolumeJob job,
                                           core::EventEmitter &emitter);

// Runs the jobs with at most `concurrent_volumes` in flight. Results are
// returned in job order.
std::vector<VolumeResult> run_batch(std::vector<VolumeJob> jobs,
                                    int concurrent_volumes,
                                    core::EventEmitter &emitter);

} // namespace tomo_preview::pipeline
