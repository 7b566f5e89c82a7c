#include "Watermark.hpp"

#include "BitPlane.hpp"
#include "ContentHash.hpp"
#include "core/Errors.hpp"
#include "core/Logging.hpp"

#include <cmath>
#include <fmt/format.h>

namespace reclaim::watermark {

namespace {
std::shared_ptr<spdlog::logger> watermarkLogger() {
  static auto logger = log::moduleLogger("Watermark");
  return logger;
}

Bytes encodePngOrThrow(const cv::Mat &image) {
  auto encoded = encodeImage(image, ImageFormat::Png);
  if (!encoded) {
    throw MalformedInputError(fmt::format("Failed to encode output image: {}",
                                          errorToString(encoded.error())));
  }
  return std::move(*encoded);
}
} // namespace

cv::Mat decodeOrThrow(const Bytes &imageBytes) {
  auto decoded = decodeImage(imageBytes);
  if (!decoded) {
    throw MalformedInputError(fmt::format("Cannot decode image: {}",
                                          errorToString(decoded.error())));
  }
  return std::move(*decoded);
}

WatermarkRecord makeRecord(const cv::Mat &image, std::string creatorId,
                           SourceType sourceType, uint32_t timestamp) {
  WatermarkRecord record;
  record.version = payload::kSupportedVersion;
  record.creatorId = std::move(creatorId);
  record.timestamp = timestamp;
  record.contentFingerprint = hashing::shortFingerprint(image);
  record.sourceType = sourceType;
  return record;
}

void embedInPlace(cv::Mat &image, const WatermarkRecord &record) {
  const auto bits = payload::encode(record);
  bitplane::writeBits(image, bits);
  watermarkLogger()->info(
      "Embedded {} record for {} ({} bits, fingerprint {})",
      toString(record.sourceType), record.creatorId, bits.size(),
      payload::fingerprintToHex(record.contentFingerprint));
}

cv::Mat embed(const cv::Mat &image, const WatermarkRecord &record) {
  cv::Mat result = image.clone();
  embedInPlace(result, record);
  return result;
}

std::optional<WatermarkRecord> extract(const cv::Mat &image) {
  const auto bits = bitplane::readBits(image, payload::kMaxPayloadBits);
  auto record = payload::decode(bits);
  if (record) {
    watermarkLogger()->info("Found record for {} signed at {}",
                            record->creatorId, record->timestamp);
  } else {
    watermarkLogger()->debug("No watermark in {}x{} image", image.cols,
                             image.rows);
  }
  return record;
}

bool hasWatermark(const cv::Mat &image) { return extract(image).has_value(); }

EmbedResult embedEncoded(const Bytes &imageBytes,
                         const WatermarkRecord &record) {
  cv::Mat image = decodeOrThrow(imageBytes);
  embedInPlace(image, record);
  return {encodePngOrThrow(image), record};
}

EmbedResult embedEncoded(const Bytes &imageBytes, std::string creatorId,
                         SourceType sourceType, uint32_t timestamp,
                         std::optional<Fingerprint> fingerprint) {
  cv::Mat image = decodeOrThrow(imageBytes);

  WatermarkRecord record;
  record.creatorId = std::move(creatorId);
  record.timestamp = timestamp;
  record.sourceType = sourceType;
  // Fingerprint the pixels before any LSB is rewritten
  record.contentFingerprint =
      fingerprint ? *fingerprint : hashing::shortFingerprint(image);

  embedInPlace(image, record);
  return {encodePngOrThrow(image), std::move(record)};
}

std::optional<WatermarkRecord> extractEncoded(const Bytes &imageBytes) {
  return extract(decodeOrThrow(imageBytes));
}

int minimumSquareDimension(size_t creatorIdBytes) noexcept {
  const size_t bits = payload::requiredBits(creatorIdBytes);
  const size_t pixels = (bits + bitplane::kEmbedChannels.size() - 1) /
                        bitplane::kEmbedChannels.size();
  int side = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(pixels))));
  while (static_cast<size_t>(side) * side < pixels) {
    ++side;
  }
  return side;
}

} // namespace reclaim::watermark
