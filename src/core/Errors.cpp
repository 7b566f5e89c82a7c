#include "Errors.hpp"

#include <fmt/format.h>
#include <utility>

namespace reclaim {

CapacityExceededError::CapacityExceededError(size_t requiredBits,
                                             size_t availableBits)
    : ReclaimError(fmt::format(
          "Payload too large for image: {} bits required, {} available",
          requiredBits, availableBits)),
      required_(requiredBits), available_(availableBits) {}

MediaProcessingError::MediaProcessingError(std::string stage,
                                           const std::string &message)
    : ReclaimError(fmt::format("{}: {}", stage, message)),
      stage_(std::move(stage)) {}

std::string_view errorToString(ImageIOError error) noexcept {
  switch (error) {
  case ImageIOError::EmptyImage:
    return "Empty image";
  case ImageIOError::InvalidFormat:
    return "Invalid format";
  case ImageIOError::UnsupportedFormat:
    return "Unsupported format";
  case ImageIOError::ReadError:
    return "Read error";
  case ImageIOError::WriteError:
    return "Write error";
  default:
    return "Unknown error";
  }
}

} // namespace reclaim
