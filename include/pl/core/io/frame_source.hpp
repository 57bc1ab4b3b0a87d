// File: include/pl/core/io/frame_source.hpp
#pragma once

#include <string>

#include "pl/core/status.hpp"

namespace pl {

class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  // Returns:
  //  - path of a freshly captured temporary image on success
  //  - timeout / io_error / unavailable on failure
  // The image stays valid until the next capture() call.
  virtual Result<std::string> capture() = 0;

  virtual std::string name() const = 0;
};

}  // namespace pl
