#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tomo_preview::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& patterns);
void write_text(const fs::path& path, const std::string& text);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string format_bytes(uint64_t bytes);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace tomo_preview::core
