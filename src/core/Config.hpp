#pragma once

#include "Logging.hpp"
#include "provenance/ProvenanceSigner.hpp"
#include "video/MediaToolchain.hpp"
#include "watermark/Verification.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace reclaim {

/**
 * @brief Runtime settings, read from a JSON file where every key is
 * optional.
 */
struct ReclaimConfig {
  log::LogConfig logging;
  VideoConfig video;
  TamperPolicy tamperPolicy = TamperPolicy::AssumeIntact;
  SignerConfig signer;
  std::filesystem::path registryPath; ///< Empty: in-memory registry

  /**
   * @brief Loads a configuration file.
   * @throws MalformedInputError if the file is unreadable or invalid.
   */
  static ReclaimConfig load(const std::filesystem::path &path);

  /**
   * @brief Builds a configuration from a parsed document, keeping defaults
   * for missing keys.
   * @throws MalformedInputError on wrong types or invalid values.
   */
  static ReclaimConfig fromJson(const nlohmann::json &doc);

  nlohmann::json toJson() const;
};

} // namespace reclaim
