#pragma once

#include "image/ImageIO.hpp"
#include "watermark/Verification.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace reclaim {

/**
 * @brief Key material and options for the external manifest signer.
 */
struct SignerConfig {
  bool enabled = false;
  std::filesystem::path privateKeyPath;
  std::filesystem::path certificatePath;
  std::string tsaUrl;
  std::string claimGenerator = "Reclaim";
};

struct SigningRequest {
  std::string author;
  std::string transactionId;
  std::string title;
  nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief External manifest layer. Implementations wrap a provenance SDK;
 * the engine only consumes its results.
 */
class ProvenanceSigner {
public:
  virtual ~ProvenanceSigner() = default;

  /**
   * @brief Attaches a signed manifest to an encoded image.
   * @return The signed buffer, or std::nullopt when signing failed.
   */
  virtual std::optional<Bytes> sign(const Bytes &image,
                                    const SigningRequest &request,
                                    const SignerConfig &config) = 0;

  /**
   * @brief Reads and validates the manifest of @p image.
   * @return std::nullopt when the verifier could not run at all.
   */
  virtual std::optional<ManifestReport> verify(const Bytes &image) = 0;
};

} // namespace reclaim
