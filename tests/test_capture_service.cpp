// File: tests/test_capture_service.cpp
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "pl/core/capture/capture_service.hpp"
#include "pl/core/storage/session_markers.hpp"
#include "pl/core/util/fs_util.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

namespace {

class FileSource final : public pl::IFrameSource {
 public:
  explicit FileSource(fs::path p) : path_(std::move(p)) {}

  pl::Result<std::string> capture() override {
    if (!ok) return pl::Result<std::string>::err(pl::Status::timeout("capture timed out"));
    pl::test::write_file(path_, "jpeg-" + std::to_string(++shots));
    return pl::Result<std::string>::ok(path_.string());
  }
  std::string name() const override { return "file"; }

  bool ok = true;
  int shots = 0;

 private:
  fs::path path_;
};

class ScriptedMount final : public pl::IMountMonitor {
 public:
  bool is_healthy(std::chrono::seconds) override { return healthy; }
  bool is_writable(std::chrono::seconds) override { return healthy; }
  bool try_remount() override {
    ++remounts;
    return remount_fixes;
  }

  bool healthy = true;
  bool remount_fixes = false;
  int remounts = 0;
};

struct CaptureFixture {
  pl::test::TempDir tmp;
  pl::Config cfg;
  FileSource source{tmp / "snapshot.jpg"};
  ScriptedMount mount;
  pl::test::RecordingEventSink sink;

  CaptureFixture() {
    cfg.storage.primary_root = (tmp / "primary").string();
    cfg.storage.fallback_root = (tmp / "local").string();
    cfg.storage.copy_timeout_s = 5;
    cfg.mount.check_interval_s = 300;
    fs::create_directories(tmp / "primary");
  }

  pl::FreeSpaceProbe plenty() {
    return [](const fs::path&) { return pl::Result<std::int64_t>::ok(100000); };
  }
};

}  // namespace

TEST(CaptureService, SessionLifecycleOnHealthyPrimary) {
  CaptureFixture f;
  pl::DualTierStore store(f.cfg.storage, f.plenty());
  pl::ServiceRunner runner("capture", f.cfg, "test.yaml");
  pl::CaptureService svc(f.cfg, f.source, store, f.mount, runner, f.sink);

  pl::Session s;
  s.name = "20250114_093000_benchy";
  s.frame_count = 0;
  ASSERT_TRUE(svc.open_session(s).ok());
  EXPECT_TRUE(svc.capture_frame(s, 0));
  EXPECT_TRUE(svc.capture_frame(s, 1));
  s.frame_count = 2;
  ASSERT_TRUE(svc.finalize_session(s).ok());

  const fs::path dir = f.tmp / "primary" / s.name;
  EXPECT_EQ(pl::test::read_file(dir / "frames" / "frame_000001.jpg"), "jpeg-2");
  EXPECT_TRUE(pl::has_marker(dir, pl::Marker::kReadyForEncoding));
  EXPECT_EQ(f.sink.count("session_started"), 1);
  EXPECT_EQ(f.sink.count("session_finalized"), 1);
  EXPECT_EQ(svc.frames_dropped(), 0);
}

TEST(CaptureService, OpenSessionKeepsHeartbeatUntilFinalized) {
  CaptureFixture f;
  f.cfg.printer.poll_interval_s = 30;
  pl::DualTierStore store(f.cfg.storage, f.plenty());
  pl::ServiceRunner runner("capture", f.cfg, "test.yaml");
  pl::CaptureService svc(f.cfg, f.source, store, f.mount, runner, f.sink);

  pl::Session s;
  s.name = "s1";
  ASSERT_TRUE(svc.open_session(s).ok());
  ASSERT_TRUE(svc.capture_frame(s, 0));
  s.frame_count = 1;

  const fs::path heartbeat = pl::layout::capture_heartbeat(f.tmp / "primary" / "s1");
  svc.session_alive(s, 100.0);
  ASSERT_TRUE(fs::exists(heartbeat));

  // Throttled to the poll interval.
  pl::test::age_file(heartbeat, std::chrono::hours(1));
  svc.session_alive(s, 110.0);
  EXPECT_GE(pl::file_age(heartbeat).value(), std::chrono::minutes(59));
  svc.session_alive(s, 131.0);
  EXPECT_LT(pl::file_age(heartbeat).value(), std::chrono::minutes(1));

  ASSERT_TRUE(svc.finalize_session(s).ok());
  EXPECT_FALSE(fs::exists(heartbeat));
  EXPECT_TRUE(pl::has_marker(f.tmp / "primary" / "s1", pl::Marker::kReadyForEncoding));
}

TEST(CaptureService, FailedCaptureIsRecordedAsDropped) {
  CaptureFixture f;
  pl::DualTierStore store(f.cfg.storage, f.plenty());
  pl::ServiceRunner runner("capture", f.cfg, "test.yaml");
  pl::CaptureService svc(f.cfg, f.source, store, f.mount, runner, f.sink);

  pl::Session s;
  s.name = "s1";
  f.source.ok = false;
  EXPECT_FALSE(svc.capture_frame(s, 0));
  EXPECT_EQ(svc.frames_dropped(), 1);
  ASSERT_EQ(f.sink.count("frame_dropped"), 1);
  EXPECT_EQ(f.sink.events.back().frame_count.value_or(-1), 0);
}

TEST(CaptureService, RemountOnlyAfterSecondFailedCheckThenReconcile) {
  CaptureFixture f;
  pl::DualTierStore store(f.cfg.storage, f.plenty());
  pl::ServiceRunner runner("capture", f.cfg, "test.yaml");
  pl::CaptureService svc(f.cfg, f.source, store, f.mount, runner, f.sink);

  f.mount.healthy = false;
  svc.check_primary(0.0, /*force=*/true);
  EXPECT_FALSE(store.primary_healthy());
  EXPECT_EQ(f.mount.remounts, 0);
  EXPECT_EQ(f.sink.count("primary_state"), 1);

  // Frames go local while the primary is marked down.
  pl::Session s;
  s.name = "s1";
  ASSERT_TRUE(svc.capture_frame(s, 0));
  ASSERT_TRUE(svc.capture_frame(s, 1));
  EXPECT_TRUE(store.has_fallback_data());

  svc.check_primary(10.0);  // inside the check interval: skipped
  EXPECT_EQ(f.mount.remounts, 0);

  svc.check_primary(400.0);
  EXPECT_EQ(f.mount.remounts, 1);
  EXPECT_FALSE(store.primary_healthy());

  f.mount.remount_fixes = true;
  svc.check_primary(800.0);
  EXPECT_EQ(f.mount.remounts, 2);
  EXPECT_TRUE(store.primary_healthy());
  EXPECT_EQ(f.sink.count("reconcile"), 1);
  EXPECT_FALSE(store.has_fallback_data());
  EXPECT_TRUE(fs::exists(f.tmp / "primary" / "s1" / "frames" / "frame_000001.jpg"));
}
