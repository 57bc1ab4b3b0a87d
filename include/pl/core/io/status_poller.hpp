// File: include/pl/core/io/status_poller.hpp
#pragma once

#include <string>

#include "pl/core/status.hpp"
#include "pl/core/types.hpp"

namespace pl {

class IStatusPoller {
 public:
  virtual ~IStatusPoller() = default;

  // Returns a normalized PrinterStatus, or unavailable / timeout / parse_error.
  // Failures are transient: callers retry on the next tick.
  virtual Result<PrinterStatus> poll() = 0;

  virtual std::string name() const = 0;
};

}  // namespace pl
