#include "ContentHash.hpp"

#include "BitPlane.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <openssl/sha.h>
#include <span>
#include <vector>

namespace reclaim::hashing {

namespace {
std::string bytes_to_hex(std::span<const uint8_t> bytes) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    hex.push_back(digits[b >> 4]);
    hex.push_back(digits[b & 0x0F]);
  }
  return hex;
}

std::vector<uint8_t> rgbaBytes(const cv::Mat &image) {
  if (!bitplane::isSupported(image)) {
    throw MalformedInputError("Fingerprint requires an 8-bit BGR/BGRA image");
  }

  const int channels = image.channels();
  std::vector<uint8_t> buffer(static_cast<size_t>(image.rows) * image.cols *
                              4);
  size_t offset = 0;
  for (int y = 0; y < image.rows; ++y) {
    const auto *row = image.ptr<uchar>(y);
    for (int x = 0; x < image.cols; ++x) {
      const uchar *px = row + x * channels;
      buffer[offset++] = px[2];
      buffer[offset++] = px[1];
      buffer[offset++] = px[0];
      buffer[offset++] = channels == 4 ? px[3] : 255;
    }
  }
  return buffer;
}
} // namespace

Digest fingerprint(const cv::Mat &image) {
  const auto buffer = rgbaBytes(image);
  Digest digest{};
  SHA256(buffer.data(), buffer.size(), digest.data());
  return digest;
}

Fingerprint shortFingerprint(const cv::Mat &image) {
  const auto digest = fingerprint(image);
  Fingerprint result{};
  std::copy_n(digest.begin(), result.size(), result.begin());
  return result;
}

std::string fingerprintHex(const cv::Mat &image) {
  return bytes_to_hex(fingerprint(image));
}

std::string shortFingerprintHex(const cv::Mat &image) {
  return bytes_to_hex(shortFingerprint(image));
}

bool fingerprintsMatch(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() < 8 || rhs.size() < 8) {
    return false;
  }
  for (size_t i = 0; i < 8; ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace reclaim::hashing
