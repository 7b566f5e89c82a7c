#pragma once

#include "core/Config.hpp"
#include "provenance/ContentRegistry.hpp"
#include "provenance/ProvenanceSigner.hpp"
#include "video/VideoFrameAdapter.hpp"
#include "watermark/Verification.hpp"

#include <expected>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace reclaim {

struct SignRequest {
  std::string creatorId;
  SourceType sourceType = SourceType::Authentic;
  std::optional<std::string> aiPrompt;
  std::optional<uint32_t> timestamp; ///< Current time when empty
};

struct SignResult {
  Bytes data;             ///< Watermarked PNG, or the re-muxed clip
  WatermarkRecord record; ///< What was embedded
  std::string originalHash; ///< Hex SHA-256 of the pre-embedding pixels
  bool manifestAttached = false;
  std::optional<VideoMetadata> video;

  nlohmann::json toJson() const;
};

/**
 * @brief Sign and verify entry points for API layers.
 *
 * Composes the watermark engine with the registry, the optional manifest
 * signer and the video adapter. Methods may be called concurrently.
 */
class ReclaimService {
public:
  /**
   * @param registry Required.
   * @param signer Optional external manifest layer.
   * @param toolchain Video transcoder; ffmpeg when null.
   */
  ReclaimService(ReclaimConfig config,
                 std::shared_ptr<ContentRegistry> registry,
                 std::shared_ptr<ProvenanceSigner> signer = nullptr,
                 std::shared_ptr<MediaToolchain> toolchain = nullptr);

  /**
   * @brief Watermarks an image and records the signature.
   *
   * When a signer is configured its manifest is applied on top of the
   * watermark; if that fails the watermarked PNG is returned alone.
   *
   * @throws InvalidRecordError for an empty or over-long creatorId.
   * @throws MalformedInputError if the bytes are not a decodable image.
   * @throws CapacityExceededError if the image is too small.
   */
  SignResult signImage(const Bytes &image, const SignRequest &request);

  /**
   * @brief Extracts the watermark and checks the manifest concurrently.
   * @throws MalformedInputError if the bytes are not a decodable image.
   */
  VerificationReport verifyImage(const Bytes &image);

  /**
   * @brief Watermarks the first frame of a short clip.
   * @return The signed clip, or the rejection if the clip is too long.
   * @throws MediaProcessingError if the transcoder fails.
   */
  std::expected<SignResult, DurationExceeded>
  signVideo(const Bytes &video, const SignRequest &request);

  std::expected<VerificationReport, DurationExceeded>
  verifyVideo(const Bytes &video);

  std::future<SignResult> signImageAsync(Bytes image, SignRequest request);
  std::future<VerificationReport> verifyImageAsync(Bytes image);
  std::future<std::expected<SignResult, DurationExceeded>>
  signVideoAsync(Bytes video, SignRequest request);
  std::future<std::expected<VerificationReport, DurationExceeded>>
  verifyVideoAsync(Bytes video);

  const ReclaimConfig &config() const noexcept { return config_; }
  const VideoFrameAdapter &videoAdapter() const noexcept { return video_; }

private:
  SignResult embed(const Bytes &image, const SignRequest &request);
  void recordSignature(const SignResult &result, const SignRequest &request);
  std::optional<ManifestReport> checkManifest(const Bytes &image);
  VerificationReport classify(const std::optional<WatermarkRecord> &record,
                              std::optional<ManifestReport> manifest,
                              MediaType mediaType);
  std::string displayName(const std::string &creatorId) const;

  ReclaimConfig config_;
  std::shared_ptr<ContentRegistry> registry_;
  std::shared_ptr<ProvenanceSigner> signer_;
  VideoFrameAdapter video_;
};

} // namespace reclaim
