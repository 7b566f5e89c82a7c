#pragma once

#include "MediaToolchain.hpp"
#include "image/ImageIO.hpp"

#include <expected>
#include <memory>
#include <string>

namespace reclaim {

/**
 * @brief A clip longer than the configured limit.
 */
struct DurationExceeded {
  double durationSeconds = 0.0;
  double maxSeconds = 0.0;

  std::string message() const;
};

/**
 * @brief Bridges the image watermark to short videos through their first
 * frame.
 *
 * Every call works in its own scratch directory, removed on return whether
 * the call succeeds or throws. Tool failures surface as
 * MediaProcessingError; unreadable containers as MalformedInputError.
 */
class VideoFrameAdapter {
public:
  VideoFrameAdapter(VideoConfig config,
                    std::shared_ptr<MediaToolchain> toolchain);

  /**
   * @brief Probes @p video and enforces the duration limit.
   * @return Metadata, or the rejection when the clip is too long.
   */
  std::expected<VideoMetadata, DurationExceeded>
  probe(const Bytes &video) const;

  /**
   * @brief Returns frame 0 of @p video as PNG bytes.
   */
  Bytes extractRepresentativeFrame(const Bytes &video) const;

  /**
   * @brief Returns a copy of @p video whose frame 0 is @p frame (PNG).
   *
   * The replacement is encoded losslessly so the frame's least significant
   * bits survive.
   */
  Bytes reinjectFrame(const Bytes &video, const Bytes &frame) const;

  const VideoConfig &config() const noexcept { return config_; }

private:
  VideoConfig config_;
  std::shared_ptr<MediaToolchain> toolchain_;
};

} // namespace reclaim
