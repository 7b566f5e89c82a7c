#include "Logging.hpp"

#include <iostream>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace reclaim::log {

namespace {
std::mutex config_mutex;
LogConfig active_config;
} // namespace

void configure(const LogConfig &config) {
  std::lock_guard<std::mutex> lock(config_mutex);
  active_config = config;
  spdlog::set_level(config.level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
}

std::shared_ptr<spdlog::logger> moduleLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(config_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  std::shared_ptr<spdlog::logger> logger;
  try {
    const auto file = active_config.directory / (name + ".log");
    logger = spdlog::basic_logger_mt(name, file.string());
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed for " << name << ": " << ex.what()
              << std::endl;
    logger = spdlog::stderr_color_mt(name);
  }
  logger->set_level(active_config.level);
  return logger;
}

} // namespace reclaim::log
