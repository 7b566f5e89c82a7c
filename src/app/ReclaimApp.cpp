#include "ReclaimApp.hpp"

#include "core/Errors.hpp"
#include "core/Logging.hpp"
#include "provenance/JsonFileRegistry.hpp"
#include "watermark/BitPlane.hpp"
#include "watermark/Watermark.hpp"

#include <filesystem>
#include <iostream>

namespace reclaim {

namespace {
std::shared_ptr<spdlog::logger> appLogger() {
  static auto logger = log::moduleLogger("ReclaimApp");
  return logger;
}

// Bad arguments or input the caller can fix
class UsageError : public ReclaimError {
  using ReclaimError::ReclaimError;
};

Bytes readInput(const std::string &path) {
  auto data = readFileBytes(path);
  if (!data) {
    throw UsageError("Cannot read " + path + ": " +
                     std::string(errorToString(data.error())));
  }
  return std::move(*data);
}

void writeOutput(const std::string &path, const Bytes &data) {
  if (auto written = writeFileBytes(path, data); !written) {
    throw ReclaimError("Cannot write " + path + ": " +
                       std::string(errorToString(written.error())));
  }
}

void print(const nlohmann::json &doc) { std::cout << doc.dump(2) << std::endl; }

nlohmann::json recordToJson(const WatermarkRecord &record) {
  return {{"version", record.version},
          {"creatorId", record.creatorId},
          {"timestamp", record.timestamp},
          {"time", isoTimestamp(record.timestamp)},
          {"fingerprint", payload::fingerprintToHex(record.contentFingerprint)},
          {"sourceType", std::string(toString(record.sourceType))}};
}
} // namespace

void ReclaimApp::showHelp(const cv::CommandLineParser &parser) const {
  parser.printMessage();
  std::cout << "\nCommands: sign, verify, sign-video, verify-video, inspect, "
               "tamper\n";
}

void ReclaimApp::parseCommandLine(int argc, char **argv) {
  cv::CommandLineParser parser(
      argc, argv,
      "{help h ?   |          | show this help}"
      "{@command   |          | sign, verify, sign-video, verify-video, "
      "inspect or tamper}"
      "{@input     |          | input image or video}"
      "{o output   |          | output file}"
      "{c creator  |          | creator id to embed}"
      "{s source   |authentic | authentic or ai}"
      "{p prompt   |          | generation prompt recorded for ai content}"
      "{config     |          | JSON configuration file}"
      "{r registry |          | registry file, overrides the config}"
      "{planes     |          | directory for LSB plane images (inspect)}"
      "{q quality  |75        | JPEG quality (tamper)}");
  parser.about("Reclaim content signing");

  if (parser.has("help")) {
    showHelp(parser);
    options_.command = "help";
    return;
  }

  options_.command = parser.get<std::string>("@command");
  options_.input = parser.get<std::string>("@input");
  options_.output = parser.get<std::string>("output");
  options_.creator = parser.get<std::string>("creator");
  options_.source = parser.get<std::string>("source");
  options_.prompt = parser.get<std::string>("prompt");
  options_.planes = parser.get<std::string>("planes");
  options_.quality = parser.get<int>("quality");
  if (!parser.check()) {
    parser.printErrors();
    throw UsageError("Invalid arguments");
  }
  if (options_.command.empty() || options_.input.empty()) {
    showHelp(parser);
    throw UsageError("A command and an input file are required");
  }

  if (parser.has("config")) {
    config_ = ReclaimConfig::load(parser.get<std::string>("config"));
  }
  if (parser.has("registry")) {
    config_.registryPath = parser.get<std::string>("registry");
  }
}

int ReclaimApp::run(int argc, char **argv) {
  try {
    parseCommandLine(argc, argv);
    if (options_.command == "help") {
      return kExitOk;
    }
    log::configure(config_.logging);
    service_ = std::make_unique<ReclaimService>(
        config_, std::make_shared<JsonFileRegistry>(config_.registryPath));
    return dispatch();
  } catch (const UsageError &e) {
    print({{"success", false}, {"error", e.what()}});
    return kExitUsage;
  } catch (const MalformedInputError &e) {
    print({{"success", false}, {"error", e.what()}});
    return kExitUsage;
  } catch (const InvalidRecordError &e) {
    print({{"success", false}, {"error", e.what()}});
    return kExitUsage;
  } catch (const CapacityExceededError &e) {
    print({{"success", false},
           {"error", e.what()},
           {"requiredBits", e.requiredBits()},
           {"availableBits", e.availableBits()}});
    return kExitUsage;
  } catch (const MediaProcessingError &e) {
    appLogger()->error("{} failed: {}", e.stage(), e.what());
    print({{"success", false}, {"stage", e.stage()}, {"error", e.what()}});
    return kExitMedia;
  } catch (const std::exception &e) {
    appLogger()->error("Unexpected failure: {}", e.what());
    print({{"success", false}, {"error", e.what()}});
    return kExitMedia;
  }
}

int ReclaimApp::dispatch() {
  nlohmann::json result;
  if (options_.command == "sign") {
    result = sign();
  } else if (options_.command == "verify") {
    result = verify();
  } else if (options_.command == "sign-video") {
    result = signVideo();
  } else if (options_.command == "verify-video") {
    result = verifyVideo();
  } else if (options_.command == "inspect") {
    result = inspect();
  } else if (options_.command == "tamper") {
    result = tamper();
  } else {
    throw UsageError("Unknown command: " + options_.command);
  }
  result["success"] = true;
  print(result);
  return kExitOk;
}

SignRequest ReclaimApp::signRequest() const {
  if (options_.creator.empty()) {
    throw UsageError("--creator is required");
  }
  const auto source = sourceTypeFromString(options_.source);
  if (!source) {
    throw UsageError("--source must be 'authentic' or 'ai'");
  }
  SignRequest request;
  request.creatorId = options_.creator;
  request.sourceType = *source;
  if (!options_.prompt.empty()) {
    request.aiPrompt = options_.prompt;
  }
  return request;
}

std::string ReclaimApp::outputPath(const std::string &suffix,
                                   const std::string &extension) const {
  if (!options_.output.empty()) {
    return options_.output;
  }
  const std::filesystem::path input(options_.input);
  auto name = input.stem().string() + suffix + extension;
  return (input.parent_path() / name).string();
}

nlohmann::json ReclaimApp::sign() {
  const auto request = signRequest();
  const auto result = service_->signImage(readInput(options_.input), request);
  const auto path = outputPath("-signed", ".png");
  writeOutput(path, result.data);

  auto j = result.toJson();
  j["output"] = path;
  return j;
}

nlohmann::json ReclaimApp::verify() {
  return service_->verifyImage(readInput(options_.input)).toJson();
}

nlohmann::json ReclaimApp::signVideo() {
  const auto request = signRequest();
  auto result = service_->signVideo(readInput(options_.input), request);
  if (!result) {
    throw UsageError(result.error().message());
  }
  const auto path = outputPath("-signed", config_.video.outputExtension);
  writeOutput(path, result->data);

  auto j = result->toJson();
  j["output"] = path;
  return j;
}

nlohmann::json ReclaimApp::verifyVideo() {
  auto report = service_->verifyVideo(readInput(options_.input));
  if (!report) {
    throw UsageError(report.error().message());
  }
  return report->toJson();
}

nlohmann::json ReclaimApp::inspect() {
  const cv::Mat image = watermark::decodeOrThrow(readInput(options_.input));
  nlohmann::json j;
  j["width"] = image.cols;
  j["height"] = image.rows;
  j["channels"] = image.channels();
  j["capacityBits"] = bitplane::capacityBits(image);

  const auto record = watermark::extract(image);
  if (record) {
    j["record"] = recordToJson(*record);
    j["payloadBits"] = payload::requiredBits(*record);
  } else {
    j["record"] = nullptr;
  }

  if (!options_.planes.empty()) {
    const std::filesystem::path dir(options_.planes);
    const auto stem = std::filesystem::path(options_.input).stem().string();
    nlohmann::json planes = nlohmann::json::array();
    for (const int channel : bitplane::kEmbedChannels) {
      auto png = encodeImage(bitplane::lsbPlane(image, channel));
      if (!png) {
        throw ReclaimError("Cannot encode LSB plane");
      }
      const auto path =
          (dir / (stem + "-lsb" + std::to_string(channel) + ".png")).string();
      writeOutput(path, *png);
      planes.push_back(path);
    }
    j["planes"] = planes;
  }
  return j;
}

nlohmann::json ReclaimApp::tamper() {
  const auto original = readInput(options_.input);
  const cv::Mat image = watermark::decodeOrThrow(original);
  auto jpeg = encodeImage(image, ImageFormat::Jpeg, options_.quality);
  if (!jpeg) {
    throw ReclaimError("JPEG encoding failed");
  }
  const auto path = outputPath("-tampered", ".jpg");
  writeOutput(path, *jpeg);
  appLogger()->info("Re-encoded {} as JPEG (quality {})", options_.input,
                    options_.quality);
  return {{"output", path},
          {"originalSize", original.size()},
          {"tamperedSize", jpeg->size()},
          {"description", "Re-encoded as lossy JPEG, LSB watermark lost"}};
}

} // namespace reclaim
