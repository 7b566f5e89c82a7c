#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace reclaim {

struct VideoMetadata {
  double durationSeconds = 0.0;
  int width = 0;
  int height = 0;
  std::string format;
  bool hasAudio = false;
};

/**
 * @brief Settings for the video adapter and its transcoder.
 */
struct VideoConfig {
  double maxDurationSeconds = 10.0;
  std::chrono::milliseconds subprocessTimeout{60000};
  std::string ffmpeg = "ffmpeg";
  std::string ffprobe = "ffprobe";
  std::string tempPrefix = "reclaim-video";
  fs::path tempDirectory; ///< Empty: system temp directory
  std::string outputExtension = ".mp4";
  /// Encoder for the re-muxed clip; must be lossless in RGB or the
  /// first-frame watermark is lost.
  std::vector<std::string> videoEncoderArgs = {
      "-c:v", "libx264rgb", "-qp", "0", "-preset", "ultrafast",
      "-pix_fmt", "rgb24"};
};

/**
 * @brief The external transcoder the video adapter drives. Every method
 * throws MediaProcessingError on failure.
 */
class MediaToolchain {
public:
  virtual ~MediaToolchain() = default;

  virtual VideoMetadata probe(const fs::path &video) = 0;

  /// Writes frame 0 of @p video as an RGB PNG.
  virtual void extractFirstFrame(const fs::path &video,
                                 const fs::path &pngOut) = 0;

  /// Writes a copy of @p video whose frame 0 is replaced by @p png; other
  /// frames and the audio stream are carried over.
  virtual void replaceFirstFrame(const fs::path &video, const fs::path &png,
                                 const fs::path &output) = 0;
};

/**
 * @brief MediaToolchain backed by the ffmpeg/ffprobe executables.
 */
class FfmpegToolchain : public MediaToolchain {
public:
  explicit FfmpegToolchain(VideoConfig config);

  VideoMetadata probe(const fs::path &video) override;
  void extractFirstFrame(const fs::path &video,
                         const fs::path &pngOut) override;
  void replaceFirstFrame(const fs::path &video, const fs::path &png,
                         const fs::path &output) override;

  /// True when both executables are on PATH.
  bool available() const;

private:
  VideoConfig config_;
};

} // namespace reclaim
