// include/pl/core/util/logging.hpp
#pragma once

#include <string>

#include "pl/core/status.hpp"

namespace pl {

// Installs a colored stdout logger as spdlog's default and applies `level`
// (trace | debug | info | warn | error). Call once per executable.
Status init_logging(const std::string& service_name, const std::string& level);

}  // namespace pl
