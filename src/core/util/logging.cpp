// src/core/util/logging.cpp
#include "runbox/core/util/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace runbox {

Status init_logging(const LoggingConfig& cfg) {
  const spdlog::level::level_enum lvl = spdlog::level::from_str(cfg.level);
  // from_str falls back to "off" for names it does not know.
  if (lvl == spdlog::level::off && cfg.level != "off") {
    return Status::invalid_request("logging.level unknown: " + cfg.level);
  }

  auto logger = spdlog::get("runbox");
  if (!logger) logger = spdlog::stderr_color_mt("runbox");
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [pid %P] %v");
  logger->set_level(lvl);
  spdlog::set_default_logger(logger);
  return Status::ok_status();
}

}  // namespace runbox
