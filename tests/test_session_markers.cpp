// File: tests/test_session_markers.cpp
#include <chrono>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "pl/core/storage/session_markers.hpp"
#include "pl/core/util/fs_util.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;
using pl::Marker;
using pl::SessionState;

namespace {

fs::path make_session(const pl::test::TempDir& tmp, const char* name, int frames) {
  const fs::path dir = tmp / name;
  fs::create_directories(dir / "frames");
  for (int i = 0; i < frames; ++i) {
    pl::test::write_file(dir / "frames" / ("frame_00000" + std::to_string(i) + ".jpg"), "x");
  }
  return dir;
}

SessionState state_of(const fs::path& dir) {
  auto snap = pl::inspect_session(dir, "jpg", "mp4");
  EXPECT_TRUE(snap.ok());
  return snap.ok() ? snap->state : SessionState::kEmpty;
}

}  // namespace

TEST(SessionMarkers, LifecycleThroughClaimToComplete) {
  pl::test::TempDir tmp;
  const fs::path dir = make_session(tmp, "s1", 3);
  EXPECT_EQ(state_of(dir), SessionState::kCapturing);

  ASSERT_TRUE(pl::mark_ready(dir).ok());
  EXPECT_EQ(state_of(dir), SessionState::kReady);

  auto claimed = pl::claim(dir);
  ASSERT_TRUE(claimed.ok());
  EXPECT_TRUE(*claimed);
  EXPECT_EQ(state_of(dir), SessionState::kEncoding);
  EXPECT_FALSE(pl::has_marker(dir, Marker::kReadyForEncoding));

  ASSERT_TRUE(pl::mark_complete(dir).ok());
  EXPECT_EQ(state_of(dir), SessionState::kComplete);
  EXPECT_FALSE(pl::has_marker(dir, Marker::kEncodingInProgress));
}

TEST(SessionMarkers, SecondClaimLoses) {
  pl::test::TempDir tmp;
  const fs::path dir = make_session(tmp, "s1", 1);
  ASSERT_TRUE(pl::mark_ready(dir).ok());

  auto first = pl::claim(dir);
  auto second = pl::claim(dir);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_TRUE(*first);
  EXPECT_FALSE(*second);
}

TEST(SessionMarkers, ClaimRefreshesMarkerAge) {
  pl::test::TempDir tmp;
  const fs::path dir = make_session(tmp, "s1", 1);
  ASSERT_TRUE(pl::mark_ready(dir).ok());
  pl::test::age_file(pl::marker_path(dir, Marker::kReadyForEncoding), std::chrono::hours(5));

  ASSERT_TRUE(pl::claim(dir).ok());
  auto age = pl::file_age(pl::marker_path(dir, Marker::kEncodingInProgress));
  ASSERT_TRUE(age.ok());
  EXPECT_LT(age->count(), 60);
}

TEST(SessionMarkers, MarkReadyIsNoOpOnceEncodingStarted) {
  pl::test::TempDir tmp;
  const fs::path dir = make_session(tmp, "s1", 1);
  ASSERT_TRUE(pl::mark_ready(dir).ok());
  ASSERT_TRUE(pl::claim(dir).ok());

  ASSERT_TRUE(pl::mark_ready(dir).ok());
  EXPECT_FALSE(pl::has_marker(dir, Marker::kReadyForEncoding));

  ASSERT_TRUE(pl::mark_failed(dir).ok());
  ASSERT_TRUE(pl::mark_ready(dir).ok());
  EXPECT_FALSE(pl::has_marker(dir, Marker::kReadyForEncoding));
  EXPECT_EQ(state_of(dir), SessionState::kFailed);
}

TEST(SessionMarkers, ResetToReadyRequeues) {
  pl::test::TempDir tmp;
  const fs::path dir = make_session(tmp, "s1", 1);

  auto none = pl::reset_to_ready(dir);
  ASSERT_TRUE(none.ok());
  EXPECT_FALSE(*none);

  ASSERT_TRUE(pl::mark_ready(dir).ok());
  ASSERT_TRUE(pl::claim(dir).ok());
  auto reset = pl::reset_to_ready(dir);
  ASSERT_TRUE(reset.ok());
  EXPECT_TRUE(*reset);
  EXPECT_EQ(state_of(dir), SessionState::kReady);
}

TEST(SessionMarkers, EmptyDirectoryIsEmpty) {
  pl::test::TempDir tmp;
  const fs::path dir = make_session(tmp, "s1", 0);
  EXPECT_EQ(state_of(dir), SessionState::kEmpty);
  EXPECT_STREQ(pl::to_string(SessionState::kEmpty), "empty");
}

TEST(SessionMarkers, CloseCaptureClearsHeartbeatAndMarksReady) {
  pl::test::TempDir tmp;
  const fs::path dir = make_session(tmp, "s1", 2);
  ASSERT_TRUE(pl::touch_file(pl::layout::capture_heartbeat(dir)).ok());

  auto closed = pl::close_capture(dir, "jpg");
  ASSERT_TRUE(closed.ok()) << closed.status().message();
  EXPECT_FALSE(*closed);
  EXPECT_FALSE(fs::exists(pl::layout::capture_heartbeat(dir)));
  EXPECT_EQ(state_of(dir), SessionState::kReady);
}

TEST(SessionMarkers, CloseCaptureLeavesClaimedSessionToTheEncoder) {
  pl::test::TempDir tmp;
  const fs::path dir = make_session(tmp, "s1", 2);
  ASSERT_TRUE(pl::mark_ready(dir).ok());
  ASSERT_TRUE(pl::claim(dir).ok());

  auto closed = pl::close_capture(dir, "jpg");
  ASSERT_TRUE(closed.ok());
  EXPECT_FALSE(*closed);
  EXPECT_EQ(state_of(dir), SessionState::kEncoding);
  EXPECT_FALSE(pl::has_marker(dir, Marker::kReadyForEncoding));
}

TEST(SessionMarkers, CloseCaptureRequeuesSessionFinishedBeforeItsLastFrames) {
  pl::test::TempDir tmp;
  const fs::path dir = make_session(tmp, "s1", 2);
  ASSERT_TRUE(pl::mark_ready(dir).ok());
  ASSERT_TRUE(pl::claim(dir).ok());
  pl::test::write_file(dir / "s1.mp4", "video");
  pl::test::write_file(dir / "s1.mp4.part", "partial");
  ASSERT_TRUE(pl::mark_complete(dir).ok());
  pl::test::age_file(pl::marker_path(dir, Marker::kEncodingComplete), std::chrono::hours(1));
  for (const auto& it : fs::directory_iterator(dir / "frames")) {
    pl::test::age_file(it.path(), std::chrono::hours(2));
  }

  // Nothing new since the encode: stays complete.
  auto unchanged = pl::close_capture(dir, "jpg");
  ASSERT_TRUE(unchanged.ok());
  EXPECT_FALSE(*unchanged);
  EXPECT_EQ(state_of(dir), SessionState::kComplete);

  pl::test::write_file(dir / "frames" / "frame_000002.jpg", "x");
  auto requeued = pl::close_capture(dir, "jpg");
  ASSERT_TRUE(requeued.ok()) << requeued.status().message();
  EXPECT_TRUE(*requeued);
  EXPECT_EQ(state_of(dir), SessionState::kReady);
  EXPECT_FALSE(fs::exists(dir / "s1.mp4"));
  EXPECT_FALSE(fs::exists(dir / "s1.mp4.part"));
  EXPECT_EQ(pl::list_frames(dir / "frames", "jpg")->size(), 3u);
}

TEST(SessionMarkers, FramesNewerThanMissingReferenceIsFalse) {
  pl::test::TempDir tmp;
  const fs::path dir = make_session(tmp, "s1", 1);
  auto r = pl::frames_newer_than(dir, dir / "no-such-marker", "jpg");
  ASSERT_TRUE(r.ok());
  EXPECT_FALSE(*r);
}
