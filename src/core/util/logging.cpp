// src/core/util/logging.cpp
#include "pl/core/util/logging.hpp"

#include <memory>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace pl {

Status init_logging(const std::string& service_name, const std::string& level) {
  const auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to `off`; only accept that when asked for explicitly.
  if (lvl == spdlog::level::off && level != "off") {
    return Status::invalid_argument("unknown logging.level: " + level);
  }

  auto logger = spdlog::stdout_color_mt(service_name);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  logger->set_level(lvl);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  return Status::ok_status();
}

}  // namespace pl
