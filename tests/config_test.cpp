#include "core/Config.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "core/Errors.hpp"

namespace {

using reclaim::ReclaimConfig;
using reclaim::TamperPolicy;
namespace fs = std::filesystem;

fs::path WriteTemp(const std::string &name, const std::string &text) {
  const auto path = fs::temp_directory_path() / name;
  std::ofstream out(path, std::ios::trunc);
  out << text;
  return path;
}

bool Rejects(const nlohmann::json &doc) {
  try {
    ReclaimConfig::fromJson(doc);
  } catch (const reclaim::MalformedInputError &) {
    return true;
  }
  return false;
}

void TestDefaults() {
  const auto config = ReclaimConfig::fromJson(nlohmann::json::object());
  assert(config.logging.directory == "logs");
  assert(config.logging.level == spdlog::level::info);
  assert(config.video.maxDurationSeconds == 10.0);
  assert(config.video.subprocessTimeout == std::chrono::milliseconds(60000));
  assert(config.video.ffmpeg == "ffmpeg");
  assert(config.video.ffprobe == "ffprobe");
  assert(config.video.tempPrefix == "reclaim-video");
  assert(config.tamperPolicy == TamperPolicy::AssumeIntact);
  assert(!config.signer.enabled);
  assert(config.signer.claimGenerator == "Reclaim");
  assert(config.registryPath.empty());
}

void TestOverridesAreApplied() {
  const auto doc = nlohmann::json::parse(R"({
    "log": {"directory": "/tmp/reclaim-logs", "level": "debug"},
    "video": {"max_duration_seconds": 5, "subprocess_timeout_ms": 1500,
              "ffmpeg": "/opt/ffmpeg/bin/ffmpeg", "temp_prefix": "clip",
              "encoder_args": ["-c:v", "ffv1"], "output_extension": ".mkv"},
    "verification": {"tamper_policy": "registry_fingerprint"},
    "signer": {"enabled": true, "private_key_path": "keys/private.pem",
               "certificate_path": "keys/cert.pem", "tsa_url": "http://tsa.test"},
    "registry": {"path": "data/registry.json"}
  })");
  const auto config = ReclaimConfig::fromJson(doc);
  assert(config.logging.directory == "/tmp/reclaim-logs");
  assert(config.logging.level == spdlog::level::debug);
  assert(config.video.maxDurationSeconds == 5.0);
  assert(config.video.subprocessTimeout == std::chrono::milliseconds(1500));
  assert(config.video.ffmpeg == "/opt/ffmpeg/bin/ffmpeg");
  assert(config.video.ffprobe == "ffprobe");
  assert(config.video.tempPrefix == "clip");
  assert(config.video.videoEncoderArgs.size() == 2);
  assert(config.video.outputExtension == ".mkv");
  assert(config.tamperPolicy == TamperPolicy::RegistryFingerprint);
  assert(config.signer.enabled);
  assert(config.signer.privateKeyPath == "keys/private.pem");
  assert(config.signer.tsaUrl == "http://tsa.test");
  assert(config.registryPath == "data/registry.json");

  const auto again = ReclaimConfig::fromJson(config.toJson());
  assert(again.toJson() == config.toJson());
}

void TestInvalidValuesAreRejected() {
  assert(Rejects(nlohmann::json::array()));
  assert(Rejects({{"log", "verbose"}}));
  assert(Rejects({{"log", {{"level", "chatty"}}}}));
  assert(Rejects({{"video", {{"max_duration_seconds", 0}}}}));
  assert(Rejects({{"video", {{"max_duration_seconds", "ten"}}}}));
  assert(Rejects({{"video", {{"subprocess_timeout_ms", -1}}}}));
  assert(Rejects({{"video", {{"temp_prefix", "../escape"}}}}));
  assert(Rejects({{"verification", {{"tamper_policy", "paranoid"}}}}));
  assert(Rejects({{"signer", {{"enabled", "yes"}}}}));
  assert(!Rejects({{"log", {{"level", "off"}}}}));
}

void TestLoadFromFile() {
  const auto good = WriteTemp("reclaim-config-test.json",
                              R"({"video": {"max_duration_seconds": 7.5}})");
  assert(ReclaimConfig::load(good).video.maxDurationSeconds == 7.5);
  fs::remove(good);

  const auto bad = WriteTemp("reclaim-config-bad.json", "{ not json");
  bool threw = false;
  try {
    ReclaimConfig::load(bad);
  } catch (const reclaim::MalformedInputError &) {
    threw = true;
  }
  assert(threw);
  fs::remove(bad);

  threw = false;
  try {
    ReclaimConfig::load("/nonexistent/reclaim.json");
  } catch (const reclaim::MalformedInputError &) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaults();
  TestOverridesAreApplied();
  TestInvalidValuesAreRejected();
  TestLoadFromFile();

  std::cout << "reclaim_unit_config: pass\n";
  return 0;
}
