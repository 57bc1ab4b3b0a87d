// File: include/pl/adapters/camera/command_frame_source.hpp
#pragma once

#include <string>
#include <vector>

#include "pl/core/config.hpp"
#include "pl/core/io/frame_source.hpp"

namespace pl {

// Stills from an external capture command (rpicam-still by default), one process per frame.
class CommandFrameSource final : public IFrameSource {
 public:
  explicit CommandFrameSource(CameraConfig cfg);

  Result<std::string> capture() override;

  std::string name() const override { return cfg_.command; }

  // <command> -v 0 --immediate --nopreview --width W --height H -q Q -o <snapshot>
  std::vector<std::string> argv() const;

 private:
  CameraConfig cfg_;
};

}  // namespace pl
