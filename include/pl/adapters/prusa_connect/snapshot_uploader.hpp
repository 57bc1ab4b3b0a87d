// File: include/pl/adapters/prusa_connect/snapshot_uploader.hpp
#pragma once

#include <string>

#include "pl/core/config.hpp"
#include "pl/core/io/frame_source.hpp"
#include "pl/core/status.hpp"

namespace pl {

// Fingerprints shorter than 16 characters are right-padded with '0'.
std::string pad_fingerprint(const std::string& fp);

// Pushes live-view stills to the Prusa Connect camera endpoint.
class SnapshotUploader {
 public:
  SnapshotUploader(UploadConfig cfg, IFrameSource& source);

  // PUT one image. 200/204 is success; anything else is unavailable.
  Status upload(const std::string& image_path) const;

  // Capture + upload, tracking consecutive failures. Returns seconds to wait before the
  // next cycle: the upload interval, or the backoff once `max_failures` is reached.
  int cycle();

  int consecutive_failures() const { return failures_; }

 private:
  UploadConfig cfg_;
  IFrameSource& source_;
  std::string fingerprint_;
  int failures_ = 0;
};

}  // namespace pl
