#include "JsonFileRegistry.hpp"

#include "core/Errors.hpp"
#include "core/Logging.hpp"
#include "watermark/ContentHash.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace reclaim {

namespace {
std::shared_ptr<spdlog::logger> registryLogger() {
  static auto logger = log::moduleLogger("Registry");
  return logger;
}

template <typename T>
void putOptional(nlohmann::json &node, const char *key,
                 const std::optional<T> &value) {
  if (value) {
    node[key] = *value;
  } else {
    node[key] = nullptr;
  }
}

std::optional<std::string> getOptional(const nlohmann::json &node,
                                        const char *key) {
  if (!node.contains(key) || node.at(key).is_null()) {
    return std::nullopt;
  }
  return node.at(key).get<std::string>();
}

nlohmann::json creatorToJson(const CreatorProfile &profile) {
  nlohmann::json node;
  node["id"] = profile.id;
  putOptional(node, "display_name", profile.displayName);
  putOptional(node, "bio", profile.bio);
  putOptional(node, "website", profile.website);
  return node;
}

CreatorProfile creatorFromJson(const nlohmann::json &node) {
  CreatorProfile profile;
  profile.id = node.at("id").get<std::string>();
  profile.displayName = getOptional(node, "display_name");
  profile.bio = getOptional(node, "bio");
  profile.website = getOptional(node, "website");
  return profile;
}

nlohmann::json signatureToJson(const SignatureEntry &entry) {
  nlohmann::json node;
  node["creator_id"] = entry.creatorId;
  node["original_hash"] = entry.originalHash;
  node["source_type"] = std::string(toString(entry.sourceType));
  putOptional(node, "ai_prompt", entry.aiPrompt);
  node["signed_at"] = entry.signedAt;
  return node;
}

SignatureEntry signatureFromJson(const nlohmann::json &node) {
  SignatureEntry entry;
  entry.creatorId = node.at("creator_id").get<std::string>();
  entry.originalHash = node.at("original_hash").get<std::string>();
  const auto type = node.value("source_type", std::string("authentic"));
  const auto parsed = sourceTypeFromString(type);
  if (!parsed) {
    throw MalformedInputError("Unknown source_type in registry: " + type);
  }
  entry.sourceType = *parsed;
  entry.aiPrompt = getOptional(node, "ai_prompt");
  entry.signedAt = node.value("signed_at", 0u);
  return entry;
}
} // namespace

JsonFileRegistry::JsonFileRegistry(std::filesystem::path path)
    : path_(std::move(path)) {
  if (!path_.empty() && std::filesystem::exists(path_)) {
    load();
  }
}

void JsonFileRegistry::load() {
  std::ifstream in(path_);
  if (!in) {
    throw MalformedInputError("Cannot open registry: " + path_.string());
  }
  try {
    const auto doc = nlohmann::json::parse(in);
    for (const auto &node : doc.value("creators", nlohmann::json::array())) {
      auto profile = creatorFromJson(node);
      creators_[profile.id] = std::move(profile);
    }
    for (const auto &node : doc.value("signatures", nlohmann::json::array())) {
      signatures_.push_back(signatureFromJson(node));
    }
  } catch (const nlohmann::json::exception &e) {
    throw MalformedInputError("Invalid registry " + path_.string() + ": " +
                              e.what());
  }
  registryLogger()->info("Loaded {} creators and {} signatures from {}",
                         creators_.size(), signatures_.size(),
                         path_.string());
}

void JsonFileRegistry::persist() const {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  auto staging = path_;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::trunc);
    if (!out) {
      registryLogger()->error("Cannot write {}", staging.string());
      throw ReclaimError("Cannot write registry: " + staging.string());
    }
    out << toJsonLocked().dump(2);
  }
  std::filesystem::rename(staging, path_, ec);
  if (ec) {
    registryLogger()->error("Cannot replace {}: {}", path_.string(),
                            ec.message());
    throw ReclaimError("Cannot replace registry: " + ec.message());
  }
}

void JsonFileRegistry::recordSignature(const SignatureEntry &entry) {
  std::lock_guard lock(mutex_);
  signatures_.push_back(entry);
  // Signing implies a creator record, as with profile-less wallets
  const auto [creator, inserted] =
      creators_.try_emplace(entry.creatorId, CreatorProfile{entry.creatorId});
  try {
    persist();
  } catch (...) {
    // Memory must not hold what the file does not
    signatures_.pop_back();
    if (inserted) {
      creators_.erase(creator);
    }
    throw;
  }
  registryLogger()->info("Recorded {} signature by {} ({})",
                         toString(entry.sourceType), entry.creatorId,
                         entry.originalHash.substr(0, 8));
}

std::optional<CreatorProfile>
JsonFileRegistry::lookupCreator(const std::string &creatorId) const {
  std::lock_guard lock(mutex_);
  const auto it = creators_.find(creatorId);
  if (it == creators_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool JsonFileRegistry::hasSignature(const std::string &creatorId,
                                    const std::string &fingerprintHex) const {
  std::lock_guard lock(mutex_);
  return std::any_of(signatures_.begin(), signatures_.end(),
                     [&](const SignatureEntry &entry) {
                       return entry.creatorId == creatorId &&
                              hashing::fingerprintsMatch(entry.originalHash,
                                                         fingerprintHex);
                     });
}

std::vector<SignatureEntry>
JsonFileRegistry::signaturesBy(const std::string &creatorId) const {
  std::lock_guard lock(mutex_);
  std::vector<SignatureEntry> result;
  std::copy_if(signatures_.begin(), signatures_.end(),
               std::back_inserter(result),
               [&](const SignatureEntry &e) { return e.creatorId == creatorId; });
  return result;
}

void JsonFileRegistry::upsertCreator(const CreatorProfile &profile) {
  std::lock_guard lock(mutex_);
  creators_[profile.id] = profile;
  persist();
}

nlohmann::json JsonFileRegistry::toJson() const {
  std::lock_guard lock(mutex_);
  return toJsonLocked();
}

nlohmann::json JsonFileRegistry::toJsonLocked() const {
  nlohmann::json doc;
  doc["creators"] = nlohmann::json::array();
  for (const auto &[id, profile] : creators_) {
    doc["creators"].push_back(creatorToJson(profile));
  }
  doc["signatures"] = nlohmann::json::array();
  for (const auto &entry : signatures_) {
    doc["signatures"].push_back(signatureToJson(entry));
  }
  return doc;
}

} // namespace reclaim
