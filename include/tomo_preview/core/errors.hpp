#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tomo_preview {

class TomoPreviewError : public std::runtime_error {
public:
    explicit TomoPreviewError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public TomoPreviewError {
public:
    explicit ConfigError(const std::string& message)
        : TomoPreviewError("Config error: " + message) {}
};

class ValidationError : public TomoPreviewError {
public:
    explicit ValidationError(const std::string& message)
        : TomoPreviewError("Validation error: " + message) {}
};

class IOError : public TomoPreviewError {
public:
    explicit IOError(const std::string& message)
        : TomoPreviewError("I/O error: " + message) {}
};

// Unreadable, corrupt or wrong-rank volume file.
class ReadError : public IOError {
public:
    explicit ReadError(const std::string& message)
        : IOError("Read error: " + message) {}
};

// Invalid discard bounds. Never clamped.
class RangeError : public TomoPreviewError {
public:
    explicit RangeError(const std::string& message)
        : TomoPreviewError("Range error: " + message) {}
};

class SliceProcessingError : public TomoPreviewError {
public:
    SliceProcessingError(size_t slice_index, const std::string& message)
        : TomoPreviewError("Slice " + std::to_string(slice_index) +
                           " failed: " + message),
          slice_index_(slice_index) {}

    size_t slice_index() const { return slice_index_; }

private:
    size_t slice_index_;
};

class EncodeError : public TomoPreviewError {
public:
    explicit EncodeError(const std::string& message)
        : TomoPreviewError("Encode error: " + message) {}
};

} // namespace tomo_preview
