#include "tomo_preview/config/configuration.hpp"
#include "tomo_preview/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <map>
#include <string>

namespace tomo_preview::config {

// Warn thresholds are converted to byte counts; 1 PiB keeps that in range.
constexpr double kMaxWarnGb = 1024.0 * 1024.0;

static void read_float_pair(const YAML::Node& n, std::optional<std::array<double, 2>>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out = std::array<double, 2>{n[0].as<double>(), n[1].as<double>()};
    } else if (n && !n.IsNull()) {
        throw ConfigError("expected a [start, end] pair");
    }
}

static void read_int_pair(const YAML::Node& n, std::optional<std::array<int, 2>>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out = std::array<int, 2>{n[0].as<int>(), n[1].as<int>()};
    } else if (n && !n.IsNull()) {
        throw ConfigError("expected a [start, end] pair");
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        // Preset first so explicit keys in the same file win over it.
        if (node["preset"] && !node["preset"].IsNull()) {
            cfg.apply_preset(node["preset"].as<std::string>());
        }

        if (node["input"]) {
            auto i = node["input"];
            if (i["patterns"]) cfg.input.patterns = i["patterns"].as<std::string>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["fps"]) cfg.output.fps = o["fps"].as<double>();
            if (o["codec"]) cfg.output.codec = o["codec"].as<std::string>();
            if (o["playback"]) cfg.output.playback = o["playback"].as<std::string>();
            if (o["max_dimension"]) cfg.output.max_dimension = o["max_dimension"].as<int>();
            if (o["save_png"]) cfg.output.save_png = o["save_png"].as<bool>();
            if (o["write_video"]) cfg.output.write_video = o["write_video"].as<bool>();
            if (o["video_extension"]) cfg.output.video_extension = o["video_extension"].as<std::string>();
            if (o["png_compression"]) cfg.output.png_compression = o["png_compression"].as<int>();
        }

        if (node["enhancement"]) {
            auto e = node["enhancement"];
            if (e["clip_limit"]) cfg.enhancement.clip_limit = e["clip_limit"].as<double>();
            if (e["tile_grid_size"]) cfg.enhancement.tile_grid_size = e["tile_grid_size"].as<int>();
            if (e["adaptive_clip"]) cfg.enhancement.adaptive_clip = e["adaptive_clip"].as<bool>();
            if (e["cache_size"]) cfg.enhancement.cache_size = e["cache_size"].as<int>();
        }

        if (node["discard"]) {
            auto d = node["discard"];
            read_int_pair(d["range"], cfg.discard.range);
            read_float_pair(d["fraction"], cfg.discard.fraction);
        }

        if (node["runtime_limits"]) {
            auto r = node["runtime_limits"];
            if (r["parallel_workers"]) cfg.runtime_limits.parallel_workers = r["parallel_workers"].as<int>();
            if (r["png_writers"]) cfg.runtime_limits.png_writers = r["png_writers"].as<int>();
            if (r["concurrent_volumes"]) cfg.runtime_limits.concurrent_volumes = r["concurrent_volumes"].as<int>();
            if (r["read_warn_gb"]) cfg.runtime_limits.read_warn_gb = r["read_warn_gb"].as<double>();
            if (r["memory_warn_gb"]) cfg.runtime_limits.memory_warn_gb = r["memory_warn_gb"].as<double>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["input"]["patterns"] = input.patterns;

    node["output"]["fps"] = output.fps;
    node["output"]["codec"] = output.codec;
    node["output"]["playback"] = output.playback;
    node["output"]["max_dimension"] = output.max_dimension;
    node["output"]["save_png"] = output.save_png;
    node["output"]["write_video"] = output.write_video;
    node["output"]["video_extension"] = output.video_extension;
    node["output"]["png_compression"] = output.png_compression;

    node["enhancement"]["clip_limit"] = enhancement.clip_limit;
    node["enhancement"]["tile_grid_size"] = enhancement.tile_grid_size;
    node["enhancement"]["adaptive_clip"] = enhancement.adaptive_clip;
    node["enhancement"]["cache_size"] = enhancement.cache_size;

    if (discard.range) {
        YAML::Node r;
        r.push_back((*discard.range)[0]);
        r.push_back((*discard.range)[1]);
        node["discard"]["range"] = r;
    }
    if (discard.fraction) {
        YAML::Node f;
        f.push_back((*discard.fraction)[0]);
        f.push_back((*discard.fraction)[1]);
        node["discard"]["fraction"] = f;
    }

    node["runtime_limits"]["parallel_workers"] = runtime_limits.parallel_workers;
    node["runtime_limits"]["png_writers"] = runtime_limits.png_writers;
    node["runtime_limits"]["concurrent_volumes"] = runtime_limits.concurrent_volumes;
    node["runtime_limits"]["read_warn_gb"] = runtime_limits.read_warn_gb;
    node["runtime_limits"]["memory_warn_gb"] = runtime_limits.memory_warn_gb;

    return node;
}

void Config::validate() const {
    if (!(output.fps > 0.0) || !std::isfinite(output.fps)) {
        throw ValidationError("output.fps must be > 0");
    }
    if (output.codec.size() != 4) {
        throw ValidationError("output.codec must be a 4-character code, got '" + output.codec + "'");
    }
    if (!string_to_playback_mode(output.playback)) {
        throw ValidationError("output.playback must be 'forward' or 'forward-backward'");
    }
    if (output.max_dimension < 0) {
        throw ValidationError("output.max_dimension must be >= 0 (0 = native)");
    }
    if (output.png_compression < 0 || output.png_compression > 9) {
        throw ValidationError("output.png_compression must be in [0,9]");
    }
    if (output.write_video && output.video_extension.empty()) {
        throw ValidationError("output.video_extension must not be empty");
    }
    if (!output.write_video && !output.save_png) {
        throw ValidationError("output.write_video and output.save_png are both disabled");
    }

    if (!(enhancement.clip_limit > 0.0) || !std::isfinite(enhancement.clip_limit)) {
        throw ValidationError("enhancement.clip_limit must be > 0");
    }
    if (enhancement.tile_grid_size < 1) {
        throw ValidationError("enhancement.tile_grid_size must be >= 1");
    }
    if (enhancement.cache_size < 1) {
        throw ValidationError("enhancement.cache_size must be >= 1");
    }

    if (discard.range && discard.fraction) {
        throw ValidationError("discard.range and discard.fraction are mutually exclusive");
    }
    if (discard.range) {
        const auto& r = *discard.range;
        if (r[0] < 0 || r[1] < 0 || r[0] >= r[1]) {
            throw ValidationError("discard.range must be [start, end] with 0 <= start < end");
        }
    }
    if (discard.fraction) {
        const auto& f = *discard.fraction;
        if (!(f[0] >= 0.0 && f[0] < 1.0 && f[1] >= 0.0 && f[1] < 1.0)) {
            throw ValidationError("discard.fraction values must be in [0,1)");
        }
    }

    if (runtime_limits.parallel_workers < 0) {
        throw ValidationError("runtime_limits.parallel_workers must be >= 0 (0 = auto)");
    }
    if (runtime_limits.png_writers < 0 || runtime_limits.png_writers > 32) {
        throw ValidationError("runtime_limits.png_writers must be in [0,32] (0 = auto)");
    }
    if (runtime_limits.concurrent_volumes < 1) {
        throw ValidationError("runtime_limits.concurrent_volumes must be >= 1");
    }
    if (!(runtime_limits.read_warn_gb > 0.0 && runtime_limits.read_warn_gb <= kMaxWarnGb) ||
        !(runtime_limits.memory_warn_gb > 0.0 && runtime_limits.memory_warn_gb <= kMaxWarnGb)) {
        throw ValidationError("runtime_limits.read_warn_gb and memory_warn_gb must be in (0, " +
                              std::to_string(static_cast<int>(kMaxWarnGb)) + "]");
    }
}

void Config::apply_preset(const std::string& name) {
    struct Preset {
        double fps;
        double clip_limit;
        int max_dimension;
    };
    static const std::map<std::string, Preset> kPresets = {
        {"tomogram", {30.0, 2.0, 1024}},
        {"tomo", {30.0, 2.0, 1024}},
        {"tiltseries", {8.0, 100.0, 1024}},
        {"ts", {8.0, 100.0, 1024}},
        {"quick", {15.0, 2.0, 512}},
        {"max_quality", {30.0, 5.0, 2048}},
    };

    auto it = kPresets.find(name);
    if (it == kPresets.end()) {
        throw ConfigError("Unknown preset: " + name);
    }
    output.fps = it->second.fps;
    enhancement.clip_limit = it->second.clip_limit;
    output.max_dimension = it->second.max_dimension;
    preset = name;
}

OutputSpec Config::output_spec() const {
    OutputSpec spec;
    spec.fps = output.fps;
    spec.codec = output.codec;
    spec.playback = string_to_playback_mode(output.playback).value_or(PlaybackMode::FORWARD_BACKWARD);
    if (output.max_dimension > 0) {
        spec.max_dimension = output.max_dimension;
    }
    spec.save_png = output.save_png;
    spec.write_video = output.write_video;
    spec.video_extension = output.video_extension;
    spec.png_compression = output.png_compression;
    spec.png_writers = runtime_limits.png_writers;
    return spec;
}

EnhancementParams Config::enhancement_params() const {
    EnhancementParams p;
    p.clip_limit = enhancement.clip_limit;
    p.tile_grid_size = enhancement.tile_grid_size;
    return p;
}

std::optional<IndexRange> Config::index_range() const {
    if (!discard.range) return std::nullopt;
    return IndexRange{(*discard.range)[0], (*discard.range)[1]};
}

std::optional<FractionRange> Config::fraction_range() const {
    if (!discard.fraction) return std::nullopt;
    return FractionRange{(*discard.fraction)[0], (*discard.fraction)[1]};
}

} // namespace tomo_preview::config
