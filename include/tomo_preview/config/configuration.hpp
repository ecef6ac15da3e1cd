#pragma once

#include "tomo_preview/core/types.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace tomo_preview::config {

namespace fs = std::filesystem;

struct InputConfig {
  std::string patterns = "*.mrc;*.st;*.rec;*.ali;*.map;*.mrcs";
};

struct OutputConfig {
  double fps = 30.0;
  std::string codec = "MJPG";
  std::string playback = "forward-backward"; // forward | forward-backward
  int max_dimension = 1024;                  // 0 = native resolution
  bool save_png = false;
  bool write_video = true;
  std::string video_extension = ".avi";
  int png_compression = 6;
};

struct EnhancementConfig {
  double clip_limit = 2.0;
  int tile_grid_size = 8;
  bool adaptive_clip = false;
  int cache_size = 8;
};

struct DiscardConfig {
  std::optional<std::array<int, 2>> range;       // keep [start, end)
  std::optional<std::array<double, 2>> fraction; // trim from each end
};

struct RuntimeLimitsConfig {
  int parallel_workers = 0;   // 0 = hardware threads
  int png_writers = 0;        // 0 = min(32, 4 * hardware threads)
  int concurrent_volumes = 1;
  double read_warn_gb = 2.0;
  double memory_warn_gb = 4.0;
};

struct Config {
  InputConfig input;
  OutputConfig output;
  EnhancementConfig enhancement;
  DiscardConfig discard;
  RuntimeLimitsConfig runtime_limits;
  std::string preset;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Overwrites fps, clip limit and output size with a named preset.
  void apply_preset(const std::string &name);

  OutputSpec output_spec() const;
  EnhancementParams enhancement_params() const;
  std::optional<IndexRange> index_range() const;
  std::optional<FractionRange> fraction_range() const;
};

} // namespace tomo_preview::config
