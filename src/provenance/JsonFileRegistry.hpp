#pragma once

#include "ContentRegistry.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>

namespace reclaim {

/**
 * @brief ContentRegistry kept in memory and persisted as one JSON document.
 *
 * With an empty path nothing is written to disk. Every mutation rewrites
 * the file. All methods are safe to call from several threads.
 */
class JsonFileRegistry : public ContentRegistry {
public:
  /**
   * @param path Backing file; loaded if it exists.
   * @throws MalformedInputError if an existing file cannot be parsed.
   */
  explicit JsonFileRegistry(std::filesystem::path path = {});

  void recordSignature(const SignatureEntry &entry) override;
  std::optional<CreatorProfile>
  lookupCreator(const std::string &creatorId) const override;
  bool hasSignature(const std::string &creatorId,
                    const std::string &fingerprintHex) const override;
  std::vector<SignatureEntry>
  signaturesBy(const std::string &creatorId) const override;

  /// Inserts or replaces a creator profile.
  void upsertCreator(const CreatorProfile &profile);

  nlohmann::json toJson() const;
  const std::filesystem::path &path() const noexcept { return path_; }

private:
  void load();
  void persist() const;
  nlohmann::json toJsonLocked() const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::map<std::string, CreatorProfile> creators_;
  std::vector<SignatureEntry> signatures_;
};

} // namespace reclaim
