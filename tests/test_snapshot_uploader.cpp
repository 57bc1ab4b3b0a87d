// File: tests/test_snapshot_uploader.cpp
#include <string>

#include <gtest/gtest.h>

#include "pl/adapters/prusa_connect/snapshot_uploader.hpp"

namespace {

class FailingSource final : public pl::IFrameSource {
 public:
  pl::Result<std::string> capture() override {
    ++calls;
    return pl::Result<std::string>::err(pl::Status::timeout("camera busy"));
  }
  std::string name() const override { return "failing"; }

  int calls = 0;
};

}  // namespace

TEST(SnapshotUploader, FingerprintIsPaddedToSixteen) {
  EXPECT_EQ(pl::pad_fingerprint("cam1"), "cam1000000000000");
  EXPECT_EQ(pl::pad_fingerprint("printlapse-camera"), "printlapse-camera");
  EXPECT_EQ(pl::pad_fingerprint(""), std::string(16, '0'));
}

TEST(SnapshotUploader, BacksOffAfterMaxFailures) {
  pl::UploadConfig cfg;
  cfg.interval_s = 12;
  cfg.max_failures = 3;
  cfg.backoff_s = 60;
  FailingSource source;
  pl::SnapshotUploader up(cfg, source);

  EXPECT_EQ(up.cycle(), 12);
  EXPECT_EQ(up.cycle(), 12);
  EXPECT_EQ(up.consecutive_failures(), 2);
  EXPECT_EQ(up.cycle(), 60);
  EXPECT_EQ(up.consecutive_failures(), 0);
  EXPECT_EQ(source.calls, 3);
}

TEST(SnapshotUploader, MissingImageIsNotFound) {
  pl::UploadConfig cfg;
  FailingSource source;
  pl::SnapshotUploader up(cfg, source);
  EXPECT_EQ(up.upload("/nonexistent/snapshot.jpg").code(), pl::Status::Code::kNotFound);
}
