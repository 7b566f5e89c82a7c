#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace reclaim {

struct ProcessResult {
  int exitCode = -1;
  std::string stdoutText;
  std::string stderrText;
};

/**
 * @brief Runs external tools without a shell.
 */
class Subprocess {
public:
  /**
   * @brief Runs @p argv to completion, capturing both output streams.
   *
   * argv[0] is resolved through PATH. The child is killed once @p timeout
   * elapses.
   *
   * @throws MediaProcessingError if the process cannot be started, times
   * out, is killed by a signal or exits with a non-zero status.
   */
  static ProcessResult run(const std::vector<std::string> &argv,
                           std::chrono::milliseconds timeout);

  /**
   * @brief Returns true when @p program can be found on PATH (or is an
   * executable path).
   */
  static bool isAvailable(const std::string &program);

  static std::string joinArgs(const std::vector<std::string> &argv);
};

} // namespace reclaim
