#include "tomo_preview/io/mapped_file.hpp"
#include "tomo_preview/core/errors.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tomo_preview::io {

namespace fs = std::filesystem;

MappedFile::MappedFile(const fs::path &path) : path_(path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    throw ReadError("Cannot open " + path.string() + ": " + std::strerror(errno));
  }

  struct stat st;
  if (::fstat(fd, &st) != 0) {
    const int err = errno;
    ::close(fd);
    throw ReadError("Cannot stat " + path.string() + ": " + std::strerror(err));
  }
  if (!S_ISREG(st.st_mode)) {
    ::close(fd);
    throw ReadError("Not a regular file: " + path.string());
  }
  size_ = static_cast<size_t>(st.st_size);
  if (size_ == 0) {
    ::close(fd);
    throw ReadError("Empty file: " + path.string());
  }

  void *ptr = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);
  const int err = errno;
  ::close(fd);
  if (ptr == MAP_FAILED) {
    throw ReadError("Cannot map " + path.string() + ": " + std::strerror(err));
  }
  data_ = static_cast<const uint8_t *>(ptr);
}

MappedFile::~MappedFile() {
  if (data_) {
    ::munmap(const_cast<uint8_t *>(data_), size_);
  }
}

} // namespace tomo_preview::io
