#include "service/ReclaimService.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <opencv2/core.hpp>

#include "FakeToolchain.hpp"
#include "core/Errors.hpp"
#include "image/ImageIO.hpp"
#include "provenance/JsonFileRegistry.hpp"
#include "watermark/BitPlane.hpp"
#include "watermark/ContentHash.hpp"
#include "watermark/PayloadCodec.hpp"
#include "watermark/Watermark.hpp"

namespace {

using reclaim::Bytes;
using reclaim::ManifestReport;
using reclaim::ReclaimConfig;
using reclaim::ReclaimService;
using reclaim::SignRequest;
using reclaim::SourceType;
namespace outcome = reclaim::outcome;

// Appends a marker instead of a real manifest
class FakeSigner : public reclaim::ProvenanceSigner {
 public:
  enum class Mode { Sign, Unavailable, Throw };
  Mode mode = Mode::Sign;
  bool verifyThrows = false;
  std::optional<ManifestReport> report;
  reclaim::SigningRequest lastRequest;
  std::atomic<int> verifyCalls{0};

  std::optional<Bytes> sign(const Bytes &image, const reclaim::SigningRequest &request,
                            const reclaim::SignerConfig &config) override {
    assert(config.enabled);
    lastRequest = request;
    if (mode == Mode::Throw) {
      throw std::runtime_error("certificate expired");
    }
    if (mode == Mode::Unavailable) {
      return std::nullopt;
    }
    Bytes signedImage = image;
    signedImage.push_back('M');
    return signedImage;
  }

  std::optional<ManifestReport> verify(const Bytes &) override {
    ++verifyCalls;
    if (verifyThrows) {
      throw std::runtime_error("verifier crashed");
    }
    return report;
  }
};

Bytes NoisePng(int width, int height, uint64_t seed = 99) {
  cv::Mat image(height, width, CV_8UC3);
  cv::RNG rng(seed);
  rng.fill(image, cv::RNG::UNIFORM, 0, 256);
  auto png = reclaim::encodeImage(image);
  assert(png.has_value());
  return *png;
}

SignRequest Request(const std::string &creator, SourceType type = SourceType::Authentic) {
  SignRequest request;
  request.creatorId = creator;
  request.sourceType = type;
  request.timestamp = 1700000000;
  return request;
}

void TestSignRecordsAndVerifies() {
  auto registry = std::make_shared<reclaim::JsonFileRegistry>();
  ReclaimService service(ReclaimConfig{}, registry);

  const auto original = NoisePng(64, 64);
  const auto result = service.signImage(original, Request("  abc123 "));
  assert(result.record.creatorId == "abc123");
  assert(result.record.timestamp == 1700000000);
  assert(!result.manifestAttached);
  assert(result.originalHash.size() == 64);
  assert(result.originalHash.substr(0, 8) ==
         reclaim::payload::fingerprintToHex(result.record.contentFingerprint));

  const auto entries = registry->signaturesBy("abc123");
  assert(entries.size() == 1);
  assert(entries[0].originalHash == result.originalHash);

  const auto report = service.verifyImage(result.data);
  const auto *authentic = std::get_if<outcome::VerifiedAuthentic>(&report.outcome.kind);
  assert(authentic != nullptr);
  assert(authentic->creatorId == "abc123");
  assert(report.outcome.manifest == reclaim::ManifestStatus::Absent);
  assert(report.creatorDisplayName == "abc123");

  const auto unsignedReport = service.verifyImage(original);
  assert(std::holds_alternative<outcome::NoSignature>(unsignedReport.outcome.kind));
  assert(!unsignedReport.creatorDisplayName.has_value());
}

void TestDisplayNameComesFromRegistry() {
  auto registry = std::make_shared<reclaim::JsonFileRegistry>();
  reclaim::CreatorProfile profile;
  profile.id = "wallet-1";
  profile.displayName = "Alice";
  registry->upsertCreator(profile);
  ReclaimService service(ReclaimConfig{}, registry);

  const auto signedImage = service.signImage(NoisePng(48, 48), Request("wallet-1", SourceType::AiGenerated));
  const auto report = service.verifyImage(signedImage.data);
  assert(std::holds_alternative<outcome::VerifiedAiGenerated>(report.outcome.kind));
  assert(report.creatorDisplayName == "Alice");
  assert(report.summary() == "Verified - AI-Generated content signed by Alice");
}

void TestInvalidRequestsAreRejected() {
  auto registry = std::make_shared<reclaim::JsonFileRegistry>();
  ReclaimService service(ReclaimConfig{}, registry);

  bool threw = false;
  try {
    service.signImage(NoisePng(32, 32), Request("   "));
  } catch (const reclaim::InvalidRecordError &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    service.signImage(NoisePng(16, 16), Request(std::string(50, 'c')));
  } catch (const reclaim::CapacityExceededError &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    service.verifyImage(Bytes{1, 2, 3});
  } catch (const reclaim::MalformedInputError &) {
    threw = true;
  }
  assert(threw);
  // Nothing was recorded for the failed attempts
  assert(registry->toJson().at("signatures").empty());
}

void TestSignerIsLayeredWithFallback() {
  auto registry = std::make_shared<reclaim::JsonFileRegistry>();
  auto signer = std::make_shared<FakeSigner>();
  ReclaimConfig config;
  config.signer.enabled = true;
  ReclaimService service(config, registry, signer);

  auto result = service.signImage(NoisePng(64, 64), Request("abc123"));
  assert(result.manifestAttached);
  assert(result.data.back() == 'M');
  assert(signer->lastRequest.author == "abc123");
  assert(signer->lastRequest.transactionId ==
         reclaim::payload::fingerprintToHex(result.record.contentFingerprint));
  assert(signer->lastRequest.metadata.at("sourceType") == "authentic");

  signer->mode = FakeSigner::Mode::Throw;
  result = service.signImage(NoisePng(64, 64, 1), Request("abc123"));
  assert(!result.manifestAttached);
  assert(reclaim::watermark::extractEncoded(result.data).has_value());

  signer->mode = FakeSigner::Mode::Unavailable;
  result = service.signImage(NoisePng(64, 64, 2), Request("abc123"));
  assert(!result.manifestAttached);

  // Disabled in config: the signer is never asked to sign
  ReclaimService unsignedService(ReclaimConfig{}, registry, signer);
  signer->mode = FakeSigner::Mode::Throw;
  result = unsignedService.signImage(NoisePng(64, 64, 3), Request("abc123"));
  assert(!result.manifestAttached);
}

void TestManifestIsReportedAlongside() {
  auto registry = std::make_shared<reclaim::JsonFileRegistry>();
  auto signer = std::make_shared<FakeSigner>();
  ReclaimService service(ReclaimConfig{}, registry, signer);
  const auto signedImage = service.signImage(NoisePng(64, 64), Request("abc123"));

  signer->report = ManifestReport{true, false, "invalid", "abc123", ""};
  auto report = service.verifyImage(signedImage.data);
  assert(std::holds_alternative<outcome::VerifiedAuthentic>(report.outcome.kind));
  assert(report.outcome.manifest == reclaim::ManifestStatus::PresentInvalid);

  signer->report = ManifestReport{true, true, "valid", "abc123", ""};
  report = service.verifyImage(signedImage.data);
  assert(report.outcome.manifest == reclaim::ManifestStatus::PresentValid);

  signer->verifyThrows = true;
  report = service.verifyImage(signedImage.data);
  assert(report.outcome.verified());
  assert(report.outcome.manifest == reclaim::ManifestStatus::Absent);
  assert(signer->verifyCalls == 3);
}

void TestRegistryPolicyFlagsUnknownSignatures() {
  auto registry = std::make_shared<reclaim::JsonFileRegistry>();
  ReclaimConfig config;
  config.tamperPolicy = reclaim::TamperPolicy::RegistryFingerprint;
  ReclaimService service(config, registry);

  const auto signedImage = service.signImage(NoisePng(64, 64), Request("abc123"));
  assert(service.verifyImage(signedImage.data).outcome.verified());

  // A watermark embedded outside the service is unknown to the registry
  const auto forged = reclaim::watermark::embedEncoded(NoisePng(64, 64, 5), "abc123",
                                                       SourceType::Authentic, 1700000000);
  const auto report = service.verifyImage(forged.png);
  assert(report.outcome.tampered());
  assert(report.summary() == "Image has been modified after signing by abc123");
}

void TestVideoFlowUsesFirstFrame() {
  auto registry = std::make_shared<reclaim::JsonFileRegistry>();
  auto fake = std::make_shared<reclaim::testing::FakeToolchain>();
  ReclaimService service(ReclaimConfig{}, registry, nullptr, fake);

  const auto clip = NoisePng(64, 64);
  const auto signedClip = service.signVideo(clip, Request("abc123"));
  assert(signedClip.has_value());
  assert(signedClip->video->durationSeconds == 5.0);

  const auto report = service.verifyVideo(signedClip->data);
  assert(report.has_value());
  assert(report->mediaType == reclaim::MediaType::Video);
  assert(report->durationSeconds == 5.0);
  assert(report->summary() ==
         "Verified - Authentic video signed by abc123 (first frame watermark)");

  fake->duration = 12.0;
  const int extractsBefore = fake->extractCalls;
  assert(!service.signVideo(clip, Request("abc123")).has_value());
  assert(!service.verifyVideo(clip).has_value());
  assert(fake->extractCalls == extractsBefore);
}

void TestFailedVideoSignRecordsNothing() {
  auto registry = std::make_shared<reclaim::JsonFileRegistry>();
  auto fake = std::make_shared<reclaim::testing::FakeToolchain>();
  fake->failStage = "replace";
  ReclaimService service(ReclaimConfig{}, registry, nullptr, fake);

  bool threw = false;
  try {
    service.signVideo(NoisePng(64, 64), Request("abc123"));
  } catch (const reclaim::MediaProcessingError &) {
    threw = true;
  }
  assert(threw);
  assert(fake->replaceCalls == 1);
  assert(registry->signaturesBy("abc123").empty());
  assert(!registry->lookupCreator("abc123").has_value());

  fake->failStage.clear();
  const auto signedClip = service.signVideo(NoisePng(64, 64), Request("abc123"));
  assert(signedClip.has_value());
  assert(registry->signaturesBy("abc123").size() == 1);
}

void TestNonUtf8RecordVerifiesAsUnsigned() {
  reclaim::WatermarkRecord record;
  record.creatorId = "abc123";
  record.timestamp = 1700000000;
  auto bits = reclaim::payload::encode(record);
  // First creatorId byte becomes 0xFF
  for (size_t i = 0; i < 8; ++i) {
    bits[10 * 8 + i] = true;
  }

  cv::Mat image(64, 64, CV_8UC3, cv::Scalar(120, 80, 40));
  reclaim::bitplane::writeBits(image, bits);
  auto png = reclaim::encodeImage(image);
  assert(png.has_value());

  ReclaimService service(ReclaimConfig{},
                         std::make_shared<reclaim::JsonFileRegistry>());
  const auto report = service.verifyImage(*png);
  assert(std::holds_alternative<outcome::NoSignature>(report.outcome.kind));
  assert(!report.toJson().dump().empty());
}

void TestAsyncAndConcurrentUse() {
  auto registry = std::make_shared<reclaim::JsonFileRegistry>();
  ReclaimService service(ReclaimConfig{}, registry);

  std::vector<std::future<reclaim::SignResult>> pending;
  for (int i = 0; i < 6; ++i) {
    pending.push_back(service.signImageAsync(NoisePng(40, 40, 100 + i),
                                             Request("creator-" + std::to_string(i % 2))));
  }
  std::vector<std::future<reclaim::VerificationReport>> checks;
  for (auto &future : pending) {
    checks.push_back(service.verifyImageAsync(future.get().data));
  }
  for (auto &check : checks) {
    assert(check.get().outcome.verified());
  }
  assert(registry->signaturesBy("creator-0").size() == 3);
  assert(registry->signaturesBy("creator-1").size() == 3);
}

} // namespace

int main() {
  TestSignRecordsAndVerifies();
  TestDisplayNameComesFromRegistry();
  TestInvalidRequestsAreRejected();
  TestSignerIsLayeredWithFallback();
  TestManifestIsReportedAlongside();
  TestRegistryPolicyFlagsUnknownSignatures();
  TestVideoFlowUsesFirstFrame();
  TestFailedVideoSignRecordsNothing();
  TestNonUtf8RecordVerifiesAsUnsigned();
  TestAsyncAndConcurrentUse();

  std::cout << "reclaim_unit_service: pass\n";
  return 0;
}
