#include "Verification.hpp"

#include "core/Logging.hpp"

#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace reclaim {

namespace {
std::shared_ptr<spdlog::logger> verificationLogger() {
  static auto logger = log::moduleLogger("Verification");
  return logger;
}

// Helper for std::visit with lambdas
template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string displayNameFor(const VerificationReport &report,
                           const std::string &creatorId) {
  if (report.creatorDisplayName && !report.creatorDisplayName->empty()) {
    return *report.creatorDisplayName;
  }
  return creatorId;
}

std::string manifestSuffix(const VerificationReport &report) {
  switch (report.outcome.manifest) {
  case ManifestStatus::PresentValid:
    return " (C2PA cryptographically verified)";
  case ManifestStatus::PresentInvalid:
    if (report.manifestReport &&
        report.manifestReport->validationStatus == "unknown") {
      return " (C2PA present, self-signed certificate)";
    }
    return " (C2PA manifest failed validation)";
  case ManifestStatus::Absent:
    break;
  }
  return "";
}
} // namespace

std::string_view toString(ManifestStatus status) noexcept {
  switch (status) {
  case ManifestStatus::Absent:
    return "absent";
  case ManifestStatus::PresentValid:
    return "present_valid";
  case ManifestStatus::PresentInvalid:
    return "present_invalid";
  }
  return "unknown";
}

ManifestStatus manifestStatusFrom(const std::optional<ManifestReport> &report) {
  if (!report || !report->found) {
    return ManifestStatus::Absent;
  }
  return report->valid ? ManifestStatus::PresentValid
                       : ManifestStatus::PresentInvalid;
}

std::string_view toString(TamperPolicy policy) noexcept {
  switch (policy) {
  case TamperPolicy::AssumeIntact:
    return "assume_intact";
  case TamperPolicy::RegistryFingerprint:
    return "registry_fingerprint";
  }
  return "unknown";
}

std::optional<TamperPolicy> tamperPolicyFromString(std::string_view text) {
  if (text == "assume_intact") {
    return TamperPolicy::AssumeIntact;
  }
  if (text == "registry_fingerprint") {
    return TamperPolicy::RegistryFingerprint;
  }
  return std::nullopt;
}

bool VerificationOutcome::verified() const noexcept {
  return std::holds_alternative<outcome::VerifiedAuthentic>(kind) ||
         std::holds_alternative<outcome::VerifiedAiGenerated>(kind);
}

bool VerificationOutcome::tampered() const noexcept {
  return std::holds_alternative<outcome::ModifiedSinceSigning>(kind);
}

VerificationOutcome decide(const DecisionInputs &inputs) {
  VerificationOutcome result{outcome::NoSignature{}, inputs.manifest,
                             inputs.record};

  if (!inputs.record) {
    verificationLogger()->info("No watermark; manifest {}",
                               toString(inputs.manifest));
    return result;
  }

  const auto &record = *inputs.record;
  if (inputs.policy == TamperPolicy::RegistryFingerprint &&
      !inputs.registryMatch.value_or(false)) {
    verificationLogger()->warn(
        "Record for {} with fingerprint {} has no registry match",
        record.creatorId, payload::fingerprintToHex(record.contentFingerprint));
    result.kind = outcome::ModifiedSinceSigning{record.creatorId};
    return result;
  }

  switch (record.sourceType) {
  case SourceType::Authentic:
    result.kind = outcome::VerifiedAuthentic{record.creatorId, record.timestamp};
    break;
  case SourceType::AiGenerated:
    result.kind =
        outcome::VerifiedAiGenerated{record.creatorId, record.timestamp};
    break;
  }

  verificationLogger()->info("Verified {} record for {}; manifest {}",
                             toString(record.sourceType), record.creatorId,
                             toString(inputs.manifest));
  return result;
}

std::string isoTimestamp(uint32_t secondsSinceEpoch) {
  const std::time_t time = static_cast<std::time_t>(secondsSinceEpoch);
  std::tm utc{};
  gmtime_r(&time, &utc);
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", utc);
}

std::string VerificationReport::summary() const {
  const bool video = mediaType == MediaType::Video;
  return std::visit(
      overloaded{
          [&](const outcome::NoSignature &) -> std::string {
            if (manifestReport && manifestReport->found) {
              const auto author = manifestReport->author.empty()
                                      ? std::string("Unknown")
                                      : manifestReport->author;
              return outcome.manifest == ManifestStatus::PresentValid
                         ? fmt::format("No watermark found - C2PA verified, "
                                       "signed by {} (media was re-encoded, "
                                       "LSB watermark lost)",
                                       author)
                         : fmt::format("No watermark found - C2PA manifest "
                                       "by {} present (signature status: {})",
                                       author,
                                       manifestReport->validationStatus);
            }
            return video ? "No signature found in video - origin unknown"
                         : "No signature found - origin unknown";
          },
          [&](const outcome::VerifiedAuthentic &v) -> std::string {
            return fmt::format("Verified - Authentic {} signed by {}{}{}",
                               video ? "video" : "content",
                               displayNameFor(*this, v.creatorId),
                               video ? " (first frame watermark)" : "",
                               manifestSuffix(*this));
          },
          [&](const outcome::VerifiedAiGenerated &v) -> std::string {
            return fmt::format("Verified - AI-Generated {} signed by {}{}{}",
                               video ? "video" : "content",
                               displayNameFor(*this, v.creatorId),
                               video ? " (first frame watermark)" : "",
                               manifestSuffix(*this));
          },
          [&](const outcome::ModifiedSinceSigning &m) -> std::string {
            return fmt::format("{} has been modified after signing by {}",
                               video ? "Video" : "Image",
                               displayNameFor(*this, m.creatorId));
          },
      },
      outcome.kind);
}

nlohmann::json VerificationReport::toJson() const {
  nlohmann::json j;
  j["verified"] = outcome.verified();
  j["tampered"] = outcome.tampered();
  j["message"] = summary();
  j["mediaType"] = mediaType == MediaType::Video ? "video" : "image";
  if (durationSeconds) {
    j["duration"] = *durationSeconds;
  }

  if (outcome.record) {
    const auto &record = *outcome.record;
    j["creator"] = record.creatorId;
    j["creatorDisplayName"] = displayNameFor(*this, record.creatorId);
    j["timestamp"] = isoTimestamp(record.timestamp);
    j["sourceType"] = std::string(toString(record.sourceType));
    j["fingerprint"] = payload::fingerprintToHex(record.contentFingerprint);
    j["version"] = record.version;
  }

  nlohmann::json c2pa;
  c2pa["found"] = outcome.manifest != ManifestStatus::Absent;
  if (manifestReport && manifestReport->found) {
    c2pa["valid"] = manifestReport->valid;
    c2pa["validationStatus"] = manifestReport->validationStatus;
    if (!manifestReport->author.empty()) {
      c2pa["author"] = manifestReport->author;
    }
    if (!manifestReport->timestamp.empty()) {
      c2pa["timestamp"] = manifestReport->timestamp;
    }
  }
  j["c2pa"] = c2pa;
  return j;
}

} // namespace reclaim
