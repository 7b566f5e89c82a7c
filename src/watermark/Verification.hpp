#pragma once

#include "PayloadCodec.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace reclaim {

/**
 * @brief What the external provenance verifier reported about a manifest.
 */
struct ManifestReport {
  bool found = false;
  bool valid = false;
  std::string validationStatus; ///< e.g. "valid", "invalid", "unknown"
  std::string author;
  std::string timestamp; ///< ISO 8601, as reported by the verifier
};

enum class ManifestStatus { Absent, PresentValid, PresentInvalid };

std::string_view toString(ManifestStatus status) noexcept;
ManifestStatus manifestStatusFrom(const std::optional<ManifestReport> &report);

/**
 * @brief How a well-formed record is trusted.
 *
 * AssumeIntact reports every well-formed record as untampered. The embedded
 * fingerprint describes the pixels before embedding, so it cannot be
 * recomputed from the distributed file.
 * RegistryFingerprint additionally requires the content registry to hold a
 * signature with the record's creatorId and fingerprint.
 */
enum class TamperPolicy { AssumeIntact, RegistryFingerprint };

std::string_view toString(TamperPolicy policy) noexcept;
std::optional<TamperPolicy> tamperPolicyFromString(std::string_view text);

namespace outcome {
struct NoSignature {};
struct VerifiedAuthentic {
  std::string creatorId;
  uint32_t timestamp = 0;
};
struct VerifiedAiGenerated {
  std::string creatorId;
  uint32_t timestamp = 0;
};
struct ModifiedSinceSigning {
  std::string creatorId;
};
} // namespace outcome

using OutcomeKind =
    std::variant<outcome::NoSignature, outcome::VerifiedAuthentic,
                 outcome::VerifiedAiGenerated, outcome::ModifiedSinceSigning>;

struct VerificationOutcome {
  OutcomeKind kind;
  ManifestStatus manifest = ManifestStatus::Absent;
  std::optional<WatermarkRecord> record; ///< Extracted record, if any

  bool verified() const noexcept;
  bool tampered() const noexcept;
};

struct DecisionInputs {
  std::optional<WatermarkRecord> record;
  ManifestStatus manifest = ManifestStatus::Absent;
  TamperPolicy policy = TamperPolicy::AssumeIntact;
  /// Only consulted under RegistryFingerprint: whether the registry holds a
  /// signature matching the record. Missing counts as no match.
  std::optional<bool> registryMatch;
};

/**
 * @brief Classifies a verification attempt. Pure function of its inputs.
 *
 * The manifest status is carried alongside the classification and never
 * changes it.
 */
VerificationOutcome decide(const DecisionInputs &inputs);

enum class MediaType { Image, Video };

/**
 * @brief Outcome plus the context needed to present it to a user.
 */
struct VerificationReport {
  VerificationOutcome outcome;
  MediaType mediaType = MediaType::Image;
  std::optional<std::string> creatorDisplayName;
  std::optional<double> durationSeconds;
  std::optional<ManifestReport> manifestReport;

  std::string summary() const;
  nlohmann::json toJson() const;
};

/**
 * @brief Formats seconds since epoch as an ISO 8601 UTC string.
 */
std::string isoTimestamp(uint32_t secondsSinceEpoch);

} // namespace reclaim
