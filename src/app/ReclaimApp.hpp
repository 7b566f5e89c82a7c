#pragma once

#include "core/Config.hpp"
#include "service/ReclaimService.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <opencv2/core/utility.hpp>
#include <string>

namespace reclaim {

/**
 * @class ReclaimApp
 * @brief Command line front end of the signing service.
 *
 * Results are printed to stdout as JSON. Exit status: 0 on success, 1 for
 * caller errors (bad arguments, unreadable or oversized input), 2 when
 * media processing fails.
 */
class ReclaimApp {
public:
  static constexpr int kExitOk = 0;
  static constexpr int kExitUsage = 1;
  static constexpr int kExitMedia = 2;

  int run(int argc, char **argv);

private:
  struct Options {
    std::string command;
    std::string input;
    std::string output;
    std::string creator;
    std::string source = "authentic";
    std::string prompt;
    std::string planes;
    int quality = 75;
  };

  void parseCommandLine(int argc, char **argv);
  void showHelp(const cv::CommandLineParser &parser) const;
  int dispatch();

  nlohmann::json sign();
  nlohmann::json verify();
  nlohmann::json signVideo();
  nlohmann::json verifyVideo();
  nlohmann::json inspect();
  nlohmann::json tamper();

  SignRequest signRequest() const;
  std::string outputPath(const std::string &suffix,
                         const std::string &extension) const;

  Options options_;
  ReclaimConfig config_;
  std::unique_ptr<ReclaimService> service_;
};

} // namespace reclaim
