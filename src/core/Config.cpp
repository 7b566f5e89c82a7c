#include "Config.hpp"

#include "Errors.hpp"

#include <fmt/format.h>
#include <fstream>

namespace reclaim {

namespace {
// Copies doc[key] into target when present
template <typename T>
void read(const nlohmann::json &section, const char *key, T &target) {
  if (section.contains(key)) {
    target = section.at(key).get<T>();
  }
}

spdlog::level::level_enum parseLevel(const std::string &text) {
  const auto level = spdlog::level::from_str(text);
  if (level == spdlog::level::off && text != "off") {
    throw MalformedInputError(fmt::format("Unknown log level '{}'", text));
  }
  return level;
}

const nlohmann::json &section(const nlohmann::json &doc, const char *key) {
  static const nlohmann::json empty = nlohmann::json::object();
  if (!doc.contains(key)) {
    return empty;
  }
  const auto &node = doc.at(key);
  if (!node.is_object()) {
    throw MalformedInputError(fmt::format("'{}' must be an object", key));
  }
  return node;
}
} // namespace

ReclaimConfig ReclaimConfig::load(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    throw MalformedInputError("Cannot open config file: " + path.string());
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error &e) {
    throw MalformedInputError(
        fmt::format("Invalid JSON in {}: {}", path.string(), e.what()));
  }
  return fromJson(doc);
}

ReclaimConfig ReclaimConfig::fromJson(const nlohmann::json &doc) {
  if (!doc.is_object()) {
    throw MalformedInputError("Config root must be an object");
  }
  ReclaimConfig config;
  try {
    const auto &logNode = section(doc, "log");
    std::string directory = config.logging.directory.string();
    read(logNode, "directory", directory);
    config.logging.directory = directory;
    if (logNode.contains("level")) {
      config.logging.level = parseLevel(logNode.at("level").get<std::string>());
    }

    const auto &video = section(doc, "video");
    read(video, "max_duration_seconds", config.video.maxDurationSeconds);
    auto timeoutMs = static_cast<long long>(config.video.subprocessTimeout.count());
    read(video, "subprocess_timeout_ms", timeoutMs);
    config.video.subprocessTimeout = std::chrono::milliseconds(timeoutMs);
    read(video, "ffmpeg", config.video.ffmpeg);
    read(video, "ffprobe", config.video.ffprobe);
    read(video, "temp_prefix", config.video.tempPrefix);
    std::string tempDirectory;
    read(video, "temp_directory", tempDirectory);
    config.video.tempDirectory = tempDirectory;
    read(video, "output_extension", config.video.outputExtension);
    read(video, "encoder_args", config.video.videoEncoderArgs);
    if (config.video.maxDurationSeconds <= 0.0) {
      throw MalformedInputError("video.max_duration_seconds must be positive");
    }
    if (timeoutMs <= 0) {
      throw MalformedInputError("video.subprocess_timeout_ms must be positive");
    }
    if (config.video.tempPrefix.empty() ||
        config.video.tempPrefix.find('/') != std::string::npos) {
      throw MalformedInputError("video.temp_prefix must be a plain name");
    }

    const auto &verification = section(doc, "verification");
    if (verification.contains("tamper_policy")) {
      const auto text = verification.at("tamper_policy").get<std::string>();
      const auto policy = tamperPolicyFromString(text);
      if (!policy) {
        throw MalformedInputError(
            fmt::format("Unknown tamper_policy '{}'", text));
      }
      config.tamperPolicy = *policy;
    }

    const auto &signer = section(doc, "signer");
    read(signer, "enabled", config.signer.enabled);
    std::string keyPath, certPath;
    read(signer, "private_key_path", keyPath);
    read(signer, "certificate_path", certPath);
    config.signer.privateKeyPath = keyPath;
    config.signer.certificatePath = certPath;
    read(signer, "tsa_url", config.signer.tsaUrl);
    read(signer, "claim_generator", config.signer.claimGenerator);

    std::string registryPath;
    read(section(doc, "registry"), "path", registryPath);
    config.registryPath = registryPath;
  } catch (const nlohmann::json::exception &e) {
    throw MalformedInputError(fmt::format("Invalid config: {}", e.what()));
  }
  return config;
}

nlohmann::json ReclaimConfig::toJson() const {
  nlohmann::json doc;
  const auto level = spdlog::level::to_string_view(logging.level);
  doc["log"] = {{"directory", logging.directory.string()},
                {"level", std::string(level.data(), level.size())}};
  doc["video"] = {
      {"max_duration_seconds", video.maxDurationSeconds},
      {"subprocess_timeout_ms", video.subprocessTimeout.count()},
      {"ffmpeg", video.ffmpeg},
      {"ffprobe", video.ffprobe},
      {"temp_prefix", video.tempPrefix},
      {"temp_directory", video.tempDirectory.string()},
      {"output_extension", video.outputExtension},
      {"encoder_args", video.videoEncoderArgs}};
  doc["verification"] = {{"tamper_policy", std::string(toString(tamperPolicy))}};
  doc["signer"] = {{"enabled", signer.enabled},
                   {"private_key_path", signer.privateKeyPath.string()},
                   {"certificate_path", signer.certificatePath.string()},
                   {"tsa_url", signer.tsaUrl},
                   {"claim_generator", signer.claimGenerator}};
  doc["registry"] = {{"path", registryPath.string()}};
  return doc;
}

} // namespace reclaim
