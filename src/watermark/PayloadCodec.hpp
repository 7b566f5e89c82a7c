#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reclaim {

// Origin declared by the signer
enum class SourceType : uint8_t {
  Authentic = 0,  ///< Captured or created by a human
  AiGenerated = 1 ///< Produced by a generative model
};

std::string_view toString(SourceType type) noexcept;
std::optional<SourceType> sourceTypeFromString(std::string_view text) noexcept;

using Fingerprint = std::array<uint8_t, 4>;

/**
 * @brief Identity record carried inside a watermarked image.
 */
struct WatermarkRecord {
  uint8_t version = 1;
  std::string creatorId;           ///< Wallet address or account id (UTF-8)
  uint32_t timestamp = 0;          ///< Signing time, seconds since epoch
  Fingerprint contentFingerprint{}; ///< Short hash of the pre-embed pixels
  SourceType sourceType = SourceType::Authentic;

  bool operator==(const WatermarkRecord &) const = default;
};

using BitSequence = std::vector<bool>;

namespace payload {

constexpr uint8_t kSupportedVersion = 1;
constexpr size_t kMaxCreatorIdBytes = 255;

/// "RCLMWMK" followed by a format byte
constexpr std::array<uint8_t, 8> kMagic = {0x52, 0x43, 0x4C, 0x4D,
                                           0x57, 0x4D, 0x4B, 0x01};

constexpr size_t kMagicBits = kMagic.size() * 8;
// version + creatorId length + timestamp + fingerprint + source type
constexpr size_t kFixedBytes = kMagic.size() + 1 + 1 + 4 + 4 + 1;
constexpr size_t kMaxPayloadBits = (kFixedBytes + kMaxCreatorIdBytes) * 8;

/**
 * @brief Number of bits encode() produces for a creatorId of the given
 * length in bytes.
 */
constexpr size_t requiredBits(size_t creatorIdBytes) noexcept {
  return (kFixedBytes + creatorIdBytes) * 8;
}

size_t requiredBits(const WatermarkRecord &record) noexcept;

/**
 * @brief Serializes a record as magic marker + fields, MSB first.
 * @throws InvalidRecordError if the creatorId exceeds 255 bytes or the
 * version is not supported.
 */
BitSequence encode(const WatermarkRecord &record);

/**
 * @brief Parses a record from the first @p available bits of @p bits.
 *
 * Trailing bits beyond the record are ignored. A missing magic marker,
 * truncated field, unknown version or unknown source type all yield
 * std::nullopt; this function never throws for malformed input.
 */
std::optional<WatermarkRecord> decode(const BitSequence &bits,
                                      size_t available);

inline std::optional<WatermarkRecord> decode(const BitSequence &bits) {
  return decode(bits, bits.size());
}

/**
 * @brief Lowercase hex form of a fingerprint ("a1b2c3d4").
 */
std::string fingerprintToHex(const Fingerprint &fingerprint);

/**
 * @brief Parses exactly 8 hex characters into a fingerprint.
 */
std::optional<Fingerprint> fingerprintFromHex(std::string_view hex) noexcept;

} // namespace payload
} // namespace reclaim
