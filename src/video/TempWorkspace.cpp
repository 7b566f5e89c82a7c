#include "TempWorkspace.hpp"

#include "core/Errors.hpp"
#include "core/Logging.hpp"

#include <fmt/format.h>
#include <random>

namespace reclaim {

namespace {
std::shared_ptr<spdlog::logger> workspaceLogger() {
  static auto logger = log::moduleLogger("TempWorkspace");
  return logger;
}
} // namespace

TempWorkspace::TempWorkspace(const std::string &prefix, const fs::path &base) {
  std::error_code ec;
  const fs::path parent = base.empty() ? fs::temp_directory_path(ec) : base;
  if (ec) {
    throw MediaProcessingError("workspace", "no temporary directory: " +
                                                ec.message());
  }

  std::random_device rd;
  std::mt19937_64 gen(rd());
  for (int attempt = 0; attempt < 64; ++attempt) {
    const auto candidate =
        parent / fmt::format("{}-{:016x}", prefix, gen());
    if (fs::create_directory(candidate, ec)) {
      root_ = candidate;
      workspaceLogger()->debug("Created workspace {}", root_.string());
      return;
    }
  }
  throw MediaProcessingError("workspace",
                             "failed to create directory under " +
                                 parent.string());
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  fs::remove_all(root_, ec);
  if (ec) {
    workspaceLogger()->error("Failed to remove {}: {}", root_.string(),
                             ec.message());
  } else {
    workspaceLogger()->debug("Removed workspace {}", root_.string());
  }
}

} // namespace reclaim
