#pragma once

#include <iostream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <string>
#include "../common/paths.hpp"
#include "config/config.hpp"

namespace camper::logging {

// Route the default spdlog logger to <cache dir>/camper.log. stdout belongs
// to the control console, so nothing is logged there.
inline void init(const Config &config) {
  std::string log_dir = paths::get_cache_dir();
  paths::ensure_directory_exists(log_dir);
  std::string log_path = log_dir + "/camper.log";

  try {
    auto logger = spdlog::basic_logger_mt("camper", log_path);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex &e) {
    std::cerr << "Log file unavailable (" << e.what() << "), logging to stderr" << std::endl;
  }

  spdlog::set_pattern("[%H:%M:%S] [%l] %v");
  spdlog::set_level(spdlog::level::from_str(config.get_log_level()));
  spdlog::flush_on(spdlog::level::warn);
  spdlog::info("camper started, config {}", config.path());
}

} // namespace camper::logging
