#pragma once

#include "watermark/PayloadCodec.hpp"

#include <optional>
#include <string>
#include <vector>

namespace reclaim {

struct CreatorProfile {
  std::string id; ///< Wallet address or other stable identifier
  std::optional<std::string> displayName;
  std::optional<std::string> bio;
  std::optional<std::string> website;
};

struct SignatureEntry {
  std::string creatorId;
  std::string originalHash; ///< Hex SHA-256 of the pre-embedding pixels
  SourceType sourceType = SourceType::Authentic;
  std::optional<std::string> aiPrompt;
  uint32_t signedAt = 0;
};

/**
 * @brief Store of creators and of the media they signed.
 */
class ContentRegistry {
public:
  virtual ~ContentRegistry() = default;

  virtual void recordSignature(const SignatureEntry &entry) = 0;
  virtual std::optional<CreatorProfile>
  lookupCreator(const std::string &creatorId) const = 0;

  /**
   * @brief True when @p creatorId signed content whose hash starts with the
   * same 8 hex characters as @p fingerprintHex.
   */
  virtual bool hasSignature(const std::string &creatorId,
                            const std::string &fingerprintHex) const = 0;

  virtual std::vector<SignatureEntry>
  signaturesBy(const std::string &creatorId) const = 0;
};

} // namespace reclaim
