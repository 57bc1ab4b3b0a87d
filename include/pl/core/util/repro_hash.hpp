// File: include/pl/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "pl/core/config.hpp"

namespace pl {

// Hash the full runtime config except secrets (api key, upload token).
// Goal: if the behaviour changes between runs, the fingerprint in the event trail changes.
std::string compute_config_hash(const Config& cfg);

}  // namespace pl
