#include "logger.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace common {

void initLogging(const config::LoggingConfig& cfg) {
  auto logger = spdlog::get("vidrelay");
  if (!logger) {
    logger = spdlog::stdout_color_mt("vidrelay");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
  }

  auto level = spdlog::level::from_str(cfg.level);
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && cfg.level != "off") {
    spdlog::warn("unknown log level '{}', using info", cfg.level);
    level = spdlog::level::info;
  }
  spdlog::set_level(level);
}

}
