#include "MediaToolchain.hpp"

#include "Subprocess.hpp"
#include "core/Errors.hpp"
#include "core/Logging.hpp"

#include <nlohmann/json.hpp>
#include <optional>

namespace reclaim {

namespace {
std::shared_ptr<spdlog::logger> toolchainLogger() {
  static auto logger = log::moduleLogger("FfmpegToolchain");
  return logger;
}

// ffprobe reports numbers as strings ("5.005000")
std::optional<double> numberField(const nlohmann::json &node,
                                  const char *key) {
  if (!node.contains(key)) {
    return std::nullopt;
  }
  const auto &value = node.at(key);
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_string()) {
    try {
      return std::stod(value.get<std::string>());
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}
} // namespace

FfmpegToolchain::FfmpegToolchain(VideoConfig config)
    : config_(std::move(config)) {}

bool FfmpegToolchain::available() const {
  return Subprocess::isAvailable(config_.ffmpeg) &&
         Subprocess::isAvailable(config_.ffprobe);
}

VideoMetadata FfmpegToolchain::probe(const fs::path &video) {
  const auto result = Subprocess::run(
      {config_.ffprobe, "-v", "error", "-show_entries",
       "format=duration,format_name:stream=codec_type,width,height", "-of",
       "json", video.string()},
      config_.subprocessTimeout);

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(result.stdoutText);
  } catch (const nlohmann::json::exception &e) {
    throw MediaProcessingError("ffprobe",
                               std::string("unreadable output: ") + e.what());
  }

  VideoMetadata meta;
  bool hasVideo = false;
  if (doc.contains("streams") && doc["streams"].is_array()) {
    for (const auto &stream : doc["streams"]) {
      const auto type = stream.value("codec_type", std::string());
      if (type == "video" && !hasVideo) {
        hasVideo = true;
        meta.width = stream.value("width", 0);
        meta.height = stream.value("height", 0);
      } else if (type == "audio") {
        meta.hasAudio = true;
      }
    }
  }
  if (!hasVideo) {
    throw MalformedInputError("No video stream found");
  }

  std::optional<double> duration;
  if (doc.contains("format")) {
    duration = numberField(doc["format"], "duration");
    meta.format = doc["format"].value("format_name", std::string("unknown"));
  }
  // The length limit cannot be enforced without a duration
  if (!duration || !(*duration > 0.0)) {
    toolchainLogger()->warn("ffprobe reported no usable duration for {}",
                            video.filename().string());
    throw MalformedInputError("Video duration could not be determined");
  }
  meta.durationSeconds = *duration;

  toolchainLogger()->info("Probed {}: {}x{}, {:.2f}s, format {}, audio {}",
                          video.filename().string(), meta.width, meta.height,
                          meta.durationSeconds, meta.format, meta.hasAudio);
  return meta;
}

void FfmpegToolchain::extractFirstFrame(const fs::path &video,
                                        const fs::path &pngOut) {
  Subprocess::run({config_.ffmpeg, "-v", "error", "-y", "-i", video.string(),
                   "-vf", "select=eq(n\\,0)", "-frames:v", "1", "-pix_fmt",
                   "rgb24", pngOut.string()},
                  config_.subprocessTimeout);
  if (!fs::exists(pngOut)) {
    throw MediaProcessingError("ffmpeg", "no frame was written");
  }
  toolchainLogger()->info("Extracted first frame of {}",
                          video.filename().string());
}

void FfmpegToolchain::replaceFirstFrame(const fs::path &video,
                                        const fs::path &png,
                                        const fs::path &output) {
  std::vector<std::string> args = {
      config_.ffmpeg, "-v", "error", "-y", "-i", video.string(), "-i",
      png.string(), "-filter_complex",
      // Overlay is only enabled for frame 0; later frames pass through
      "[0:v][1:v]overlay=x=0:y=0:format=rgb:eof_action=repeat:"
      "enable='eq(n,0)'[v]",
      "-map", "[v]", "-map", "0:a?"};
  args.insert(args.end(), config_.videoEncoderArgs.begin(),
              config_.videoEncoderArgs.end());
  args.insert(args.end(), {"-c:a", "copy"});
  const auto ext = output.extension().string();
  if (ext == ".mp4" || ext == ".mov" || ext == ".m4v") {
    args.insert(args.end(), {"-movflags", "+faststart"});
  }
  args.push_back(output.string());

  Subprocess::run(args, config_.subprocessTimeout);
  if (!fs::exists(output)) {
    throw MediaProcessingError("ffmpeg", "no output clip was written");
  }
  toolchainLogger()->info("Replaced first frame of {}",
                          video.filename().string());
}

} // namespace reclaim
