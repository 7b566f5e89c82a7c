#pragma once

#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace reclaim::log {

struct LogConfig {
  std::filesystem::path directory = "logs"; ///< Directory for module logs
  spdlog::level::level_enum level = spdlog::level::info;
};

/**
 * @brief Applies the log directory and level to loggers created afterwards
 * and updates the level of the ones that already exist.
 */
void configure(const LogConfig &config);

/**
 * @brief Returns the logger registered as @p name, creating a file logger
 * at `<directory>/<name>.log` on first use.
 *
 * Falls back to a stderr logger when the file sink cannot be opened.
 */
std::shared_ptr<spdlog::logger> moduleLogger(const std::string &name);

} // namespace reclaim::log
