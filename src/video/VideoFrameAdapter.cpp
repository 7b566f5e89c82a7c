#include "VideoFrameAdapter.hpp"

#include "TempWorkspace.hpp"
#include "core/Errors.hpp"
#include "core/Logging.hpp"

#include <fmt/format.h>

namespace reclaim {

namespace {
std::shared_ptr<spdlog::logger> adapterLogger() {
  static auto logger = log::moduleLogger("VideoFrameAdapter");
  return logger;
}

void stage(const fs::path &path, const Bytes &data) {
  if (auto written = writeFileBytes(path, data); !written) {
    throw MediaProcessingError(
        "workspace", fmt::format("cannot write {}: {}", path.string(),
                                 errorToString(written.error())));
  }
}

Bytes collect(const fs::path &path) {
  auto data = readFileBytes(path);
  if (!data) {
    throw MediaProcessingError(
        "workspace", fmt::format("cannot read {}: {}", path.string(),
                                 errorToString(data.error())));
  }
  return std::move(*data);
}
} // namespace

std::string DurationExceeded::message() const {
  return fmt::format("Video is {:.1f}s long; the limit is {:.0f}s",
                     durationSeconds, maxSeconds);
}

VideoFrameAdapter::VideoFrameAdapter(VideoConfig config,
                                     std::shared_ptr<MediaToolchain> toolchain)
    : config_(std::move(config)), toolchain_(std::move(toolchain)) {
  if (!toolchain_) {
    toolchain_ = std::make_shared<FfmpegToolchain>(config_);
  }
}

std::expected<VideoMetadata, DurationExceeded>
VideoFrameAdapter::probe(const Bytes &video) const {
  if (video.empty()) {
    throw MalformedInputError("Video buffer is empty");
  }
  TempWorkspace workspace(config_.tempPrefix, config_.tempDirectory);
  const auto input = workspace.file("input");
  stage(input, video);

  auto meta = toolchain_->probe(input);
  if (meta.durationSeconds > config_.maxDurationSeconds) {
    adapterLogger()->warn("Rejected {:.2f}s clip (limit {:.0f}s)",
                          meta.durationSeconds, config_.maxDurationSeconds);
    return std::unexpected(
        DurationExceeded{meta.durationSeconds, config_.maxDurationSeconds});
  }
  return meta;
}

Bytes VideoFrameAdapter::extractRepresentativeFrame(const Bytes &video) const {
  if (video.empty()) {
    throw MalformedInputError("Video buffer is empty");
  }
  TempWorkspace workspace(config_.tempPrefix, config_.tempDirectory);
  const auto input = workspace.file("input");
  const auto frame = workspace.file("frame.png");
  stage(input, video);

  toolchain_->extractFirstFrame(input, frame);
  auto png = collect(frame);
  adapterLogger()->debug("First frame: {} bytes", png.size());
  return png;
}

Bytes VideoFrameAdapter::reinjectFrame(const Bytes &video,
                                       const Bytes &frame) const {
  if (video.empty() || frame.empty()) {
    throw MalformedInputError("Video or frame buffer is empty");
  }
  TempWorkspace workspace(config_.tempPrefix, config_.tempDirectory);
  const auto input = workspace.file("input");
  const auto framePath = workspace.file("frame.png");
  const auto output = workspace.file("output" + config_.outputExtension);
  stage(input, video);
  stage(framePath, frame);

  toolchain_->replaceFirstFrame(input, framePath, output);
  auto clip = collect(output);
  adapterLogger()->info("Re-muxed clip: {} -> {} bytes", video.size(),
                        clip.size());
  return clip;
}

} // namespace reclaim
