#include "PayloadCodec.hpp"

#include "core/Errors.hpp"
#include "core/Logging.hpp"

#include <algorithm>
#include <bitset>
#include <fmt/format.h>

namespace reclaim {

namespace {
std::shared_ptr<spdlog::logger> payloadLogger() {
  static auto logger = log::moduleLogger("PayloadCodec");
  return logger;
}

void appendByte(BitSequence &bits, uint8_t byte) {
  std::bitset<8> byteBits(byte);
  for (int i = 7; i >= 0; --i) {
    bits.push_back(byteBits[i]);
  }
}

// Strict UTF-8: no overlongs, no surrogates, nothing past U+10FFFF
bool isValidUtf8(std::string_view text) {
  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<uint8_t>(text[i]);
    size_t extra = 0;
    uint32_t codePoint = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      codePoint = lead & 0x07;
    } else {
      return false;
    }
    if (i + extra >= text.size()) {
      return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
      const auto next = static_cast<uint8_t>(text[i + k]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      codePoint = (codePoint << 6) | (next & 0x3F);
    }
    static constexpr uint32_t kMinimum[] = {0, 0x80, 0x800, 0x10000};
    if (codePoint < kMinimum[extra] || codePoint > 0x10FFFF ||
        (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

// Sequential MSB-first reader bounded by the caller's bit count
class BitReader {
public:
  BitReader(const BitSequence &bits, size_t available)
      : bits_(bits), limit_(std::min(available, bits.size())) {}

  bool canRead(size_t byteCount) const {
    return pos_ + byteCount * 8 <= limit_;
  }

  uint8_t readByte() {
    uint8_t value = 0;
    for (int i = 0; i < 8; ++i) {
      value = static_cast<uint8_t>((value << 1) | (bits_[pos_++] ? 1 : 0));
    }
    return value;
  }

  uint32_t readUint32() {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
      value = (value << 8) | readByte();
    }
    return value;
  }

private:
  const BitSequence &bits_;
  size_t limit_;
  size_t pos_ = 0;
};
} // namespace

std::string_view toString(SourceType type) noexcept {
  switch (type) {
  case SourceType::Authentic:
    return "authentic";
  case SourceType::AiGenerated:
    return "ai";
  }
  return "unknown";
}

std::optional<SourceType> sourceTypeFromString(std::string_view text) noexcept {
  if (text == "authentic") {
    return SourceType::Authentic;
  }
  if (text == "ai") {
    return SourceType::AiGenerated;
  }
  return std::nullopt;
}

namespace payload {

size_t requiredBits(const WatermarkRecord &record) noexcept {
  return requiredBits(record.creatorId.size());
}

BitSequence encode(const WatermarkRecord &record) {
  if (record.version != kSupportedVersion) {
    throw InvalidRecordError(
        fmt::format("Unsupported payload version {}", record.version));
  }
  if (record.creatorId.size() > kMaxCreatorIdBytes) {
    throw InvalidRecordError(
        fmt::format("creatorId is {} bytes, limit is {}",
                    record.creatorId.size(), kMaxCreatorIdBytes));
  }
  if (!isValidUtf8(record.creatorId)) {
    throw InvalidRecordError("creatorId is not valid UTF-8");
  }

  BitSequence bits;
  bits.reserve(requiredBits(record));

  for (uint8_t byte : kMagic) {
    appendByte(bits, byte);
  }
  appendByte(bits, record.version);
  appendByte(bits, static_cast<uint8_t>(record.creatorId.size()));
  for (char c : record.creatorId) {
    appendByte(bits, static_cast<uint8_t>(c));
  }
  for (int shift = 24; shift >= 0; shift -= 8) {
    appendByte(bits, static_cast<uint8_t>(record.timestamp >> shift));
  }
  for (uint8_t byte : record.contentFingerprint) {
    appendByte(bits, byte);
  }
  appendByte(bits, static_cast<uint8_t>(record.sourceType));

  payloadLogger()->debug("Encoded record for {} into {} bits",
                         record.creatorId, bits.size());
  return bits;
}

std::optional<WatermarkRecord> decode(const BitSequence &bits,
                                      size_t available) {
  BitReader reader(bits, available);

  if (!reader.canRead(kMagic.size())) {
    return std::nullopt;
  }
  for (uint8_t expected : kMagic) {
    if (reader.readByte() != expected) {
      return std::nullopt;
    }
  }

  if (!reader.canRead(2)) {
    payloadLogger()->warn("Magic marker found but header is truncated");
    return std::nullopt;
  }

  WatermarkRecord record;
  record.version = reader.readByte();
  if (record.version != kSupportedVersion) {
    payloadLogger()->warn("Rejecting payload with unsupported version {}",
                          record.version);
    return std::nullopt;
  }

  const size_t idLength = reader.readByte();
  // creatorId, timestamp, fingerprint and source type must all be present
  if (!reader.canRead(idLength + 4 + 4 + 1)) {
    payloadLogger()->warn("creatorId length {} runs past available bits",
                          idLength);
    return std::nullopt;
  }

  record.creatorId.reserve(idLength);
  for (size_t i = 0; i < idLength; ++i) {
    record.creatorId.push_back(static_cast<char>(reader.readByte()));
  }
  if (!isValidUtf8(record.creatorId)) {
    payloadLogger()->warn("Rejecting payload whose creatorId is not UTF-8");
    return std::nullopt;
  }
  record.timestamp = reader.readUint32();
  for (auto &byte : record.contentFingerprint) {
    byte = reader.readByte();
  }

  const uint8_t source = reader.readByte();
  switch (source) {
  case static_cast<uint8_t>(SourceType::Authentic):
    record.sourceType = SourceType::Authentic;
    break;
  case static_cast<uint8_t>(SourceType::AiGenerated):
    record.sourceType = SourceType::AiGenerated;
    break;
  default:
    payloadLogger()->warn("Rejecting payload with unknown source type {}",
                          source);
    return std::nullopt;
  }

  return record;
}

std::string fingerprintToHex(const Fingerprint &fingerprint) {
  return fmt::format("{:02x}{:02x}{:02x}{:02x}", fingerprint[0],
                     fingerprint[1], fingerprint[2], fingerprint[3]);
}

std::optional<Fingerprint> fingerprintFromHex(std::string_view hex) noexcept {
  if (hex.size() != 8) {
    return std::nullopt;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };

  Fingerprint result{};
  for (size_t i = 0; i < result.size(); ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    result[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return result;
}

} // namespace payload
} // namespace reclaim
