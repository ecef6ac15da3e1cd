#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace tomo_preview::io {

// Read-only memory mapping of a whole file. Pages are faulted in on access,
// so opening a large volume does not load its samples.
class MappedFile {
public:
  explicit MappedFile(const std::filesystem::path &path);
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  const uint8_t *data_ = nullptr;
  size_t size_ = 0;
};

} // namespace tomo_preview::io
