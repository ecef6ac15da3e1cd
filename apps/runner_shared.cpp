#include "runner_shared.hpp"

#include "tomo_preview/core/errors.hpp"
#include "tomo_preview/core/utils.hpp"

#include <algorithm>
#include <limits>
#include <thread>

namespace tomo_preview::runner {

namespace fs = std::filesystem;

uint64_t estimate_total_file_bytes(const std::vector<fs::path> &paths) {
  uint64_t total = 0;
  for (const auto &p : paths) {
    std::error_code ec;
    const auto sz = fs::file_size(p, ec);
    if (ec) {
      continue;
    }
    if (total <= std::numeric_limits<uint64_t>::max() - static_cast<uint64_t>(sz)) {
      total += static_cast<uint64_t>(sz);
    } else {
      total = std::numeric_limits<uint64_t>::max();
      break;
    }
  }
  return total;
}

std::vector<fs::path> collect_inputs(const fs::path &input, const std::string &patterns) {
  std::error_code ec;
  if (fs::is_regular_file(input, ec)) {
    return {input};
  }
  if (fs::is_directory(input, ec)) {
    return core::discover_files(input, patterns);
  }
  throw IOError("Input not found: " + input.string());
}

int volume_worker_count(int parallel_workers, int concurrent_volumes) {
  int total = parallel_workers;
  if (total <= 0) {
    total = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
  }
  return std::max(1, total / std::max(1, concurrent_volumes));
}

pipeline::VolumeJob make_volume_job(const config::Config &cfg, const fs::path &input,
                                    const fs::path &output_dir) {
  constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;

  pipeline::VolumeJob job;
  job.input = input;
  job.output_dir = output_dir;
  job.output = cfg.output_spec();
  job.enhancement = cfg.enhancement_params();
  job.adaptive_clip = cfg.enhancement.adaptive_clip;
  job.index_range = cfg.index_range();
  job.fraction_range = cfg.fraction_range();
  job.workers = volume_worker_count(cfg.runtime_limits.parallel_workers,
                                    cfg.runtime_limits.concurrent_volumes);
  job.cache_size = static_cast<size_t>(cfg.enhancement.cache_size);
  job.read_warn_bytes = static_cast<uint64_t>(cfg.runtime_limits.read_warn_gb * kGiB);
  job.memory_warn_bytes = static_cast<uint64_t>(cfg.runtime_limits.memory_warn_gb * kGiB);
  return job;
}

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace tomo_preview::runner
