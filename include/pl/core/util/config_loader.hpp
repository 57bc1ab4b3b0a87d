// include/pl/core/util/config_loader.hpp
#pragma once

#include <string>

#include "pl/core/config.hpp"
#include "pl/core/status.hpp"

namespace pl {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
// - A leading `~/` in path values is expanded against $HOME.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

}  // namespace pl
