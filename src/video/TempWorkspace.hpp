#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace reclaim {

/**
 * @brief Uniquely named scratch directory, removed with everything in it
 * when the object is destroyed.
 */
class TempWorkspace {
public:
  /**
   * @param prefix Directory name prefix.
   * @param base Parent directory; the system temp directory when empty.
   * @throws MediaProcessingError if no directory could be created.
   */
  explicit TempWorkspace(const std::string &prefix, const fs::path &base = {});
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  const fs::path &path() const noexcept { return root_; }
  fs::path file(const std::string &name) const { return root_ / name; }

private:
  fs::path root_;
};

} // namespace reclaim
