#include "ReclaimService.hpp"

#include "core/Errors.hpp"
#include "core/Logging.hpp"
#include "watermark/ContentHash.hpp"
#include "watermark/Watermark.hpp"

#include <chrono>

namespace reclaim {

namespace {
std::shared_ptr<spdlog::logger> serviceLogger() {
  static auto logger = log::moduleLogger("ReclaimService");
  return logger;
}

uint32_t now() {
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch());
  return static_cast<uint32_t>(seconds.count());
}

std::string trimmed(const std::string &text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

Bytes encodePng(const cv::Mat &image) {
  auto png = encodeImage(image, ImageFormat::Png);
  if (!png) {
    throw ReclaimError(std::string("PNG encoding failed: ") +
                       std::string(errorToString(png.error())));
  }
  return std::move(*png);
}
} // namespace

nlohmann::json SignResult::toJson() const {
  nlohmann::json j;
  j["creatorId"] = record.creatorId;
  j["timestamp"] = isoTimestamp(record.timestamp);
  j["originalHash"] = originalHash;
  j["fingerprint"] = payload::fingerprintToHex(record.contentFingerprint);
  j["version"] = record.version;
  j["sourceType"] = std::string(toString(record.sourceType));
  j["c2paApplied"] = manifestAttached;
  j["size"] = data.size();
  if (video) {
    j["duration"] = video->durationSeconds;
    j["width"] = video->width;
    j["height"] = video->height;
  }
  return j;
}

ReclaimService::ReclaimService(ReclaimConfig config,
                               std::shared_ptr<ContentRegistry> registry,
                               std::shared_ptr<ProvenanceSigner> signer,
                               std::shared_ptr<MediaToolchain> toolchain)
    : config_(std::move(config)), registry_(std::move(registry)),
      signer_(std::move(signer)),
      video_(config_.video, std::move(toolchain)) {
  if (!registry_) {
    throw std::invalid_argument("ReclaimService requires a content registry");
  }
}

SignResult ReclaimService::embed(const Bytes &image,
                                 const SignRequest &request) {
  const auto creatorId = trimmed(request.creatorId);
  if (creatorId.empty()) {
    throw InvalidRecordError("Creator ID is required");
  }

  cv::Mat pixels = watermark::decodeOrThrow(image);
  SignResult result;
  result.originalHash = hashing::fingerprintHex(pixels);
  result.record = watermark::makeRecord(pixels, creatorId, request.sourceType,
                                        request.timestamp.value_or(now()));
  watermark::embedInPlace(pixels, result.record);
  result.data = encodePng(pixels);
  return result;
}

// Called once the signed output exists
void ReclaimService::recordSignature(const SignResult &result,
                                     const SignRequest &request) {
  SignatureEntry entry;
  entry.creatorId = result.record.creatorId;
  entry.originalHash = result.originalHash;
  entry.sourceType = request.sourceType;
  entry.aiPrompt = request.aiPrompt;
  entry.signedAt = result.record.timestamp;
  registry_->recordSignature(entry);
}

SignResult ReclaimService::signImage(const Bytes &image,
                                     const SignRequest &request) {
  auto result = embed(image, request);
  recordSignature(result, request);

  if (signer_ && config_.signer.enabled) {
    SigningRequest signing;
    signing.author = displayName(result.record.creatorId);
    signing.transactionId =
        payload::fingerprintToHex(result.record.contentFingerprint);
    signing.metadata = {
        {"sourceType", std::string(toString(result.record.sourceType))},
        {"platform", config_.signer.claimGenerator}};
    try {
      if (auto signedImage = signer_->sign(result.data, signing,
                                           config_.signer)) {
        result.data = std::move(*signedImage);
        result.manifestAttached = true;
      } else {
        serviceLogger()->warn("Manifest signer returned nothing, keeping "
                              "watermark-only image");
      }
    } catch (const std::exception &e) {
      serviceLogger()->warn("Manifest signing failed, keeping watermark-only "
                            "image: {}",
                            e.what());
    }
  }

  serviceLogger()->info("Signed image for {} ({}, manifest {})",
                        result.record.creatorId,
                        toString(result.record.sourceType),
                        result.manifestAttached);
  return result;
}

std::optional<ManifestReport>
ReclaimService::checkManifest(const Bytes &image) {
  if (!signer_) {
    return std::nullopt;
  }
  try {
    return signer_->verify(image);
  } catch (const std::exception &e) {
    serviceLogger()->warn("Manifest verification failed: {}", e.what());
    return std::nullopt;
  }
}

std::string ReclaimService::displayName(const std::string &creatorId) const {
  const auto profile = registry_->lookupCreator(creatorId);
  if (profile && profile->displayName && !profile->displayName->empty()) {
    return *profile->displayName;
  }
  return creatorId;
}

VerificationReport
ReclaimService::classify(const std::optional<WatermarkRecord> &record,
                         std::optional<ManifestReport> manifest,
                         MediaType mediaType) {
  DecisionInputs inputs;
  inputs.record = record;
  inputs.manifest = manifestStatusFrom(manifest);
  inputs.policy = config_.tamperPolicy;
  if (record && config_.tamperPolicy == TamperPolicy::RegistryFingerprint) {
    inputs.registryMatch = registry_->hasSignature(
        record->creatorId,
        payload::fingerprintToHex(record->contentFingerprint));
  }

  VerificationReport report;
  report.outcome = decide(inputs);
  report.mediaType = mediaType;
  report.manifestReport = std::move(manifest);
  if (record) {
    report.creatorDisplayName = displayName(record->creatorId);
  }
  return report;
}

VerificationReport ReclaimService::verifyImage(const Bytes &image) {
  const cv::Mat pixels = watermark::decodeOrThrow(image);

  std::future<std::optional<ManifestReport>> manifest;
  if (signer_) {
    manifest = std::async(std::launch::async,
                          [this, &image] { return checkManifest(image); });
  }
  const auto record = watermark::extract(pixels);

  auto report = classify(record,
                         manifest.valid() ? manifest.get() : std::nullopt,
                         MediaType::Image);
  serviceLogger()->info("Verified image: {}", report.summary());
  return report;
}

std::expected<SignResult, DurationExceeded>
ReclaimService::signVideo(const Bytes &video, const SignRequest &request) {
  auto meta = video_.probe(video);
  if (!meta) {
    return std::unexpected(meta.error());
  }

  const auto frame = video_.extractRepresentativeFrame(video);
  auto result = embed(frame, request);
  result.data = video_.reinjectFrame(video, result.data);
  result.video = *meta;
  recordSignature(result, request);

  serviceLogger()->info("Signed {:.2f}s video for {}", meta->durationSeconds,
                        result.record.creatorId);
  return result;
}

std::expected<VerificationReport, DurationExceeded>
ReclaimService::verifyVideo(const Bytes &video) {
  auto meta = video_.probe(video);
  if (!meta) {
    return std::unexpected(meta.error());
  }

  const auto frame = video_.extractRepresentativeFrame(video);
  const auto record = watermark::extractEncoded(frame);

  // No manifest layer exists for video
  auto report = classify(record, std::nullopt, MediaType::Video);
  report.durationSeconds = meta->durationSeconds;
  serviceLogger()->info("Verified video: {}", report.summary());
  return report;
}

std::future<SignResult> ReclaimService::signImageAsync(Bytes image,
                                                       SignRequest request) {
  return std::async(std::launch::async,
                    [this, image = std::move(image),
                     request = std::move(request)] {
                      return signImage(image, request);
                    });
}

std::future<VerificationReport> ReclaimService::verifyImageAsync(Bytes image) {
  return std::async(std::launch::async, [this, image = std::move(image)] {
    return verifyImage(image);
  });
}

std::future<std::expected<SignResult, DurationExceeded>>
ReclaimService::signVideoAsync(Bytes video, SignRequest request) {
  return std::async(std::launch::async,
                    [this, video = std::move(video),
                     request = std::move(request)] {
                      return signVideo(video, request);
                    });
}

std::future<std::expected<VerificationReport, DurationExceeded>>
ReclaimService::verifyVideoAsync(Bytes video) {
  return std::async(std::launch::async, [this, video = std::move(video)] {
    return verifyVideo(video);
  });
}

} // namespace reclaim
