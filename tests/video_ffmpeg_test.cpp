#include "service/ReclaimService.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

#include "image/ImageIO.hpp"
#include "provenance/JsonFileRegistry.hpp"
#include "video/MediaToolchain.hpp"
#include "video/Subprocess.hpp"
#include "video/TempWorkspace.hpp"

namespace {

using reclaim::Bytes;
using reclaim::Subprocess;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

constexpr int kSkip = 77;

bool ToolchainUsable() {
  if (!Subprocess::isAvailable("ffmpeg") || !Subprocess::isAvailable("ffprobe")) {
    return false;
  }
  const auto encoders = Subprocess::run({"ffmpeg", "-hide_banner", "-encoders"}, 30000ms);
  return encoders.stdoutText.find("libx264rgb") != std::string::npos;
}

Bytes MakeClip(const reclaim::TempWorkspace &workspace, const std::string &name,
               int seconds) {
  const auto path = workspace.file(name);
  const auto length = std::to_string(seconds);
  Subprocess::run({"ffmpeg", "-v", "error", "-y", "-f", "lavfi", "-i",
                   "testsrc=duration=" + length + ":size=96x64:rate=10", "-f", "lavfi", "-i",
                   "sine=frequency=440:duration=" + length, "-c:v", "mpeg4", "-q:v", "2",
                   "-c:a", "aac", "-shortest", path.string()},
                  60000ms);
  auto bytes = reclaim::readFileBytes(path);
  assert(bytes.has_value());
  return *bytes;
}

std::string AudioDigest(const fs::path &clip) {
  return Subprocess::run({"ffmpeg", "-v", "error", "-i", clip.string(), "-map", "0:a",
                          "-c", "copy", "-f", "md5", "-"},
                         60000ms)
      .stdoutText;
}

void TestSignAndVerifyShortClip(reclaim::ReclaimService &service,
                                const reclaim::TempWorkspace &workspace) {
  const auto clip = MakeClip(workspace, "short.mp4", 5);

  reclaim::SignRequest request;
  request.creatorId = "abc123";
  request.timestamp = 1700000000;
  const auto signedClip = service.signVideo(clip, request);
  assert(signedClip.has_value());
  assert(signedClip->video.has_value());
  assert(std::abs(signedClip->video->durationSeconds - 5.0) < 0.2);

  const auto report = service.verifyVideo(signedClip->data);
  assert(report.has_value());
  const auto *authentic =
      std::get_if<reclaim::outcome::VerifiedAuthentic>(&report->outcome.kind);
  assert(authentic != nullptr);
  assert(authentic->creatorId == "abc123");
  assert(authentic->timestamp == 1700000000);
  assert(report->durationSeconds.has_value());
  assert(std::abs(*report->durationSeconds - 5.0) < 0.2);

  // Audio packets are carried over unchanged
  const auto signedPath = workspace.file("signed.mp4");
  assert(reclaim::writeFileBytes(signedPath, signedClip->data).has_value());
  reclaim::FfmpegToolchain toolchain(service.config().video);
  assert(toolchain.probe(signedPath).hasAudio);
  assert(AudioDigest(workspace.file("short.mp4")) == AudioDigest(signedPath));

  // The unsigned original has no watermark
  const auto original = service.verifyVideo(clip);
  assert(original.has_value());
  assert(!original->outcome.verified());
}

void TestLongClipIsRejected(reclaim::ReclaimService &service,
                            const reclaim::TempWorkspace &workspace) {
  const auto clip = MakeClip(workspace, "long.mp4", 12);
  reclaim::SignRequest request;
  request.creatorId = "abc123";
  const auto result = service.signVideo(clip, request);
  assert(!result.has_value());
  assert(result.error().durationSeconds > 10.0);
}

void TestGarbageIsRejected(reclaim::ReclaimService &service) {
  const Bytes garbage = {'n', 'o', 't', ' ', 'v', 'i', 'd', 'e', 'o'};
  bool threw = false;
  try {
    (void)service.verifyVideo(garbage);
  } catch (const reclaim::ReclaimError &) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  if (!ToolchainUsable()) {
    std::cout << "reclaim_integration_video_ffmpeg: skipped (ffmpeg with libx264rgb not found)\n";
    return kSkip;
  }

  reclaim::TempWorkspace workspace("reclaim-ffmpeg-test");
  reclaim::ReclaimService service(reclaim::ReclaimConfig{},
                                  std::make_shared<reclaim::JsonFileRegistry>());
  TestSignAndVerifyShortClip(service, workspace);
  TestLongClipIsRejected(service, workspace);
  TestGarbageIsRejected(service);

  std::cout << "reclaim_integration_video_ffmpeg: pass\n";
  return 0;
}
