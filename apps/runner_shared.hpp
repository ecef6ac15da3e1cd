#pragma once

#include "tomo_preview/config/configuration.hpp"
#include "tomo_preview/pipeline/volume_pipeline.hpp"

#include <cstdint>
#include <filesystem>
#include <streambuf>
#include <string>
#include <vector>

namespace tomo_preview::runner {

uint64_t estimate_total_file_bytes(const std::vector<std::filesystem::path> &paths);

// A single file is taken as-is; a directory is scanned for `patterns`.
// Throws IOError when `input` is neither.
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path &input,
                                                  const std::string &patterns);

// Slice workers for each of `concurrent_volumes` volumes running at once.
int volume_worker_count(int parallel_workers, int concurrent_volumes);

pipeline::VolumeJob make_volume_job(const config::Config &cfg,
                                    const std::filesystem::path &input,
                                    const std::filesystem::path &output_dir);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace tomo_preview::runner
