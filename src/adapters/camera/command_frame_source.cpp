// File: src/adapters/camera/command_frame_source.cpp
#include "pl/adapters/camera/command_frame_source.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>

#include "pl/core/util/subprocess.hpp"

namespace pl {

CommandFrameSource::CommandFrameSource(CameraConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> CommandFrameSource::argv() const {
  return {
      cfg_.command, "-v", "0", "--immediate", "--nopreview",
      "--width",    std::to_string(cfg_.width),
      "--height",   std::to_string(cfg_.height),
      "-q",         std::to_string(cfg_.quality),
      "-o",         cfg_.snapshot_path,
  };
}

Result<std::string> CommandFrameSource::capture() {
  namespace fs = std::filesystem;
  using R = Result<std::string>;

  // A stale snapshot must never pass for a fresh one.
  std::error_code ec;
  fs::remove(cfg_.snapshot_path, ec);

  auto run = run_process(argv(), std::chrono::seconds(cfg_.timeout_s));
  if (!run.ok()) return R::err(run.status());

  if (run->timed_out) {
    return R::err(Status::timeout(cfg_.command + " timed out after " +
                                  std::to_string(cfg_.timeout_s) + "s"));
  }
  if (!run->success()) {
    std::string msg = cfg_.command + " failed (" + run->describe() + ")";
    if (!run->output.empty()) msg += ": " + run->output.substr(0, 200);
    return R::err(Status::unavailable(msg));
  }

  const auto size = fs::file_size(cfg_.snapshot_path, ec);
  if (ec || size == 0) {
    return R::err(Status::io_error(cfg_.command + " produced no image at " + cfg_.snapshot_path));
  }
  return R::ok(cfg_.snapshot_path);
}

}  // namespace pl
