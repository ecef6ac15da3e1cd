#include "runner_shared.hpp"

#include "tomo_preview/config/configuration.hpp"
#include "tomo_preview/core/errors.hpp"
#include "tomo_preview/core/events.hpp"
#include "tomo_preview/core/utils.hpp"
#include "tomo_preview/io/mrc_io.hpp"
#include "tomo_preview/pipeline/volume_pipeline.hpp"

#include <CLI/CLI.hpp>

#include <array>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace tomo_preview;
using core::json;

// Values given on the command line; unset ones leave the config alone.
struct RunOverrides {
  std::string config_path;
  std::string preset;
  std::optional<double> fps;
  std::optional<double> clip_limit;
  std::optional<int> tile_grid_size;
  std::optional<std::string> codec;
  std::optional<std::string> playback;
  std::vector<int> discard_range;
  std::vector<double> discard_fraction;
  std::optional<int> output_size;
  std::optional<int> workers;
  std::optional<int> concurrent_volumes;
  bool png = false;
  bool no_video = false;
  bool adaptive_clip = false;
};

config::Config build_config(const RunOverrides &o) {
  config::Config cfg;
  if (!o.config_path.empty()) {
    cfg = config::Config::load(o.config_path);
  }
  if (!o.preset.empty()) {
    cfg.apply_preset(o.preset);
  }

  if (o.fps) cfg.output.fps = *o.fps;
  if (o.clip_limit) cfg.enhancement.clip_limit = *o.clip_limit;
  if (o.tile_grid_size) cfg.enhancement.tile_grid_size = *o.tile_grid_size;
  if (o.codec) cfg.output.codec = *o.codec;
  if (o.playback) cfg.output.playback = *o.playback;
  if (o.output_size) cfg.output.max_dimension = *o.output_size;
  if (o.workers) cfg.runtime_limits.parallel_workers = *o.workers;
  if (o.concurrent_volumes) cfg.runtime_limits.concurrent_volumes = *o.concurrent_volumes;
  if (o.png) cfg.output.save_png = true;
  if (o.no_video) cfg.output.write_video = false;
  if (o.adaptive_clip) cfg.enhancement.adaptive_clip = true;

  // A range given on the command line replaces whichever one the file set.
  if (!o.discard_range.empty()) {
    cfg.discard.range = std::array<int, 2>{o.discard_range[0], o.discard_range[1]};
    if (o.discard_fraction.empty()) cfg.discard.fraction.reset();
  }
  if (!o.discard_fraction.empty()) {
    cfg.discard.fraction =
        std::array<double, 2>{o.discard_fraction[0], o.discard_fraction[1]};
    if (o.discard_range.empty()) cfg.discard.range.reset();
  }

  cfg.validate();
  return cfg;
}

int run_command(const fs::path &input, const fs::path &output_dir,
                const RunOverrides &overrides) {
  config::Config cfg;
  try {
    cfg = build_config(overrides);
  } catch (const TomoPreviewError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::vector<fs::path> files;
  try {
    files = runner::collect_inputs(input, cfg.input.patterns);
  } catch (const TomoPreviewError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  if (files.empty()) {
    std::cerr << "Error: No volume files found in " << input.string() << std::endl;
    return 1;
  }

  const std::string run_id = core::get_run_id();
  std::error_code ec;
  fs::create_directories(output_dir / "logs", ec);
  if (ec) {
    std::cerr << "Error: Cannot create " << (output_dir / "logs").string() << ": "
              << ec.message() << std::endl;
    return 1;
  }
  try {
    cfg.save(output_dir / "logs" / (run_id + "_config.yaml"));
  } catch (const ConfigError &e) {
    std::cerr << "[WARNING] " << e.what() << std::endl;
  }

  std::ofstream event_log_file(output_dir / "logs" / (run_id + ".jsonl"));
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_stream(&tee_buf);
  core::EventEmitter emitter(run_id, log_stream);

  const int concurrent = cfg.runtime_limits.concurrent_volumes;
  emitter.run_start({{"input", input.string()},
                     {"output_dir", output_dir.string()},
                     {"files", files.size()},
                     {"total_bytes", runner::estimate_total_file_bytes(files)},
                     {"preset", cfg.preset},
                     {"concurrent_volumes", concurrent},
                     {"workers_per_volume",
                      runner::volume_worker_count(cfg.runtime_limits.parallel_workers,
                                                  concurrent)}});

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Files: " << files.size() << std::endl;
  std::cout << "Output: " << output_dir.string() << std::endl;

  std::vector<pipeline::VolumeJob> jobs;
  jobs.reserve(files.size());
  for (const auto &f : files) {
    jobs.push_back(runner::make_volume_job(cfg, f, output_dir));
  }
  const auto results = pipeline::run_batch(std::move(jobs), concurrent, emitter);

  size_t succeeded = 0;
  json failed = json::array();
  for (const auto &r : results) {
    if (r.ok()) {
      ++succeeded;
    } else {
      failed.push_back({{"input", r.input.string()},
                        {"status", pipeline::volume_status_to_string(r.status)}});
    }
  }

  const bool success = succeeded > 0;
  emitter.run_end(success, success ? (failed.empty() ? "ok" : "partial") : "error",
                  {{"succeeded", succeeded}, {"failed", failed}});
  std::cout << "Done: " << succeeded << "/" << results.size() << " succeeded"
            << std::endl;
  return success ? 0 : 1;
}

int estimate_memory_command(const fs::path &input, const std::string &config_path,
                            std::optional<double> warn_gb) {
  config::Config cfg;
  std::vector<fs::path> files;
  try {
    if (!config_path.empty()) {
      cfg = config::Config::load(config_path);
    }
    if (warn_gb) cfg.runtime_limits.memory_warn_gb = *warn_gb;
    cfg.validate();
    files = runner::collect_inputs(input, cfg.input.patterns);
  } catch (const TomoPreviewError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  if (files.empty()) {
    std::cerr << "Error: No volume files found in " << input.string() << std::endl;
    return 1;
  }

  const auto warn_bytes = static_cast<uint64_t>(cfg.runtime_limits.memory_warn_gb *
                                                1024.0 * 1024.0 * 1024.0);
  size_t readable = 0;
  for (const auto &f : files) {
    try {
      const io::MrcHeader h = io::read_mrc_header(f);
      const io::MemoryEstimate est = io::estimate_memory(h, warn_bytes);
      std::cout << f.filename().string() << ": " << h.nx << "x" << h.ny << "x" << h.nz
                << " " << sample_type_to_string(h.sample_type)
                << ", raw " << core::format_bytes(est.raw_bytes)
                << ", processing ~" << core::format_bytes(est.processing_bytes)
                << " [" << io::memory_verdict_to_string(est.verdict) << "]"
                << std::endl;
      ++readable;
    } catch (const TomoPreviewError &e) {
      std::cerr << f.filename().string() << ": " << e.what() << std::endl;
    }
  }
  return readable > 0 ? 0 : 1;
}

int info_command(const fs::path &input) {
  try {
    const io::MrcHeader h = io::read_mrc_header(input);
    json j;
    j["file"] = input.string();
    j["nx"] = h.nx;
    j["ny"] = h.ny;
    j["nz"] = h.nz;
    j["mode"] = h.mode;
    j["sample_type"] = sample_type_to_string(h.sample_type);
    j["big_endian"] = h.big_endian;
    j["voxel_size"] = h.voxel_size();
    j["dmin"] = h.dmin;
    j["dmax"] = h.dmax;
    j["dmean"] = h.dmean;
    j["rms"] = h.rms;
    j["ispg"] = h.ispg;
    j["extended_header_bytes"] = h.nsymbt;
    j["data_bytes"] = h.data_bytes();
    j["labels"] = h.labels;
    std::cout << j.dump(2) << std::endl;
    return 0;
  } catch (const TomoPreviewError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Tomogram preview runner"};
  app.require_subcommand(1);

  std::string input, output_dir;
  RunOverrides o;

  auto run_cmd = app.add_subcommand("run", "Convert volumes to preview videos/PNGs");
  run_cmd->add_option("input", input, "Volume file or directory")->required();
  run_cmd->add_option("-o,--output-dir", output_dir, "Output directory")->required();
  run_cmd->add_option("--config", o.config_path, "Path to config.yaml");
  run_cmd->add_option("--preset", o.preset,
                      "tomogram|tomo|tiltseries|ts|quick|max_quality");
  run_cmd->add_option("--fps", o.fps, "Frames per second");
  run_cmd->add_option("--clip-limit", o.clip_limit, "CLAHE clip limit");
  run_cmd->add_option("--tile-grid-size", o.tile_grid_size, "CLAHE tile grid size");
  run_cmd->add_option("--codec", o.codec, "FourCC video codec");
  run_cmd->add_option("--playback", o.playback, "forward|forward-backward");
  run_cmd->add_option("--discard-range", o.discard_range, "Keep slices [A, B)")
      ->expected(2);
  run_cmd->add_option("--discard-fraction", o.discard_fraction,
                      "Trim fraction A from the start and B from the end")
      ->expected(2);
  run_cmd->add_option("--output-size", o.output_size,
                      "Max output dimension (0 = native)");
  run_cmd->add_option("--workers", o.workers, "Slice workers (0 = auto)");
  run_cmd->add_option("--concurrent-volumes", o.concurrent_volumes,
                      "Volumes processed at once");
  run_cmd->add_flag("--png", o.png, "Also export PNG slices");
  run_cmd->add_flag("--no-video", o.no_video, "Skip the video");
  run_cmd->add_flag("--adaptive-clip", o.adaptive_clip,
                    "Scale the clip limit with the data range");

  std::string mem_input, mem_config;
  std::optional<double> mem_warn_gb;
  auto mem_cmd = app.add_subcommand("estimate-memory", "Estimate memory per volume");
  mem_cmd->add_option("input", mem_input, "Volume file or directory")->required();
  mem_cmd->add_option("--config", mem_config, "Path to config.yaml");
  mem_cmd->add_option("--warn-gb", mem_warn_gb, "Warning threshold in GiB");

  std::string info_input;
  auto info_cmd = app.add_subcommand("info", "Print the header of one volume as JSON");
  info_cmd->add_option("input", info_input, "Volume file")->required();

  CLI11_PARSE(app, argc, argv);

  try {
    if (run_cmd->parsed()) {
      return run_command(input, output_dir, o);
    }
    if (mem_cmd->parsed()) {
      return estimate_memory_command(mem_input, mem_config, mem_warn_gb);
    }
    if (info_cmd->parsed()) {
      return info_command(info_input);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cout << app.help() << std::endl;
  return 1;
}
