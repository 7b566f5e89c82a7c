#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace reclaim {

/**
 * @brief Base class for every failure reported by the watermarking engine.
 */
class ReclaimError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * @brief The image cannot hold the encoded payload.
 */
class CapacityExceededError : public ReclaimError {
public:
  CapacityExceededError(size_t requiredBits, size_t availableBits);

  size_t requiredBits() const noexcept { return required_; }
  size_t availableBits() const noexcept { return available_; }

private:
  size_t required_;
  size_t available_;
};

/**
 * @brief Input is not a decodable image/video, or a config file is invalid.
 */
class MalformedInputError : public ReclaimError {
  using ReclaimError::ReclaimError;
};

/**
 * @brief A record violates a codec limit at encode time.
 */
class InvalidRecordError : public ReclaimError {
  using ReclaimError::ReclaimError;
};

/**
 * @brief External transcoder failed, timed out or could not be started.
 */
class MediaProcessingError : public ReclaimError {
public:
  MediaProcessingError(std::string stage, const std::string &message);

  const std::string &stage() const noexcept { return stage_; }

private:
  std::string stage_;
};

// Decode failures of the image layer, returned through std::expected
enum class ImageIOError {
  EmptyImage,
  InvalidFormat,
  UnsupportedFormat,
  ReadError,
  WriteError
};

std::string_view errorToString(ImageIOError error) noexcept;

} // namespace reclaim
