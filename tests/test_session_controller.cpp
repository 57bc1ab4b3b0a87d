// File: tests/test_session_controller.cpp
#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "pl/core/session/session_controller.hpp"

namespace {

using pl::PrinterStatus;
using pl::Session;
using pl::SessionController;
using pl::SessionControllerState;
using pl::SessionMode;
using pl::Status;
using pl::TickInput;
using pl::TickResult;

class FakeHooks final : public pl::SessionHooks {
 public:
  Status open_session(const Session& s) override {
    opened.push_back(s.name);
    return open_status;
  }
  bool capture_frame(const Session&, int index) override {
    indices.push_back(index);
    return capture_ok;
  }
  Status finalize_session(const Session& s) override {
    finalized.push_back(s);
    return Status::ok_status();
  }
  void session_alive(const Session&, double now_s) override { alive_at.push_back(now_s); }

  Status open_status;
  bool capture_ok = true;
  std::vector<std::string> opened;
  std::vector<int> indices;
  std::vector<Session> finalized;
  std::vector<double> alive_at;
};

PrinterStatus printing(std::optional<pl::JobId> job, std::optional<float> progress = std::nullopt) {
  PrinterStatus st;
  st.is_printing = true;
  st.is_job_active = true;
  st.job_id = job;
  st.job_name = std::string("benchy.gcode");
  st.progress_percent = progress;
  st.state_text = "PRINTING";
  return st;
}

PrinterStatus paused(std::optional<pl::JobId> job) {
  PrinterStatus st = printing(job);
  st.is_printing = false;
  st.state_text = "PAUSED";
  return st;
}

PrinterStatus idle() {
  PrinterStatus st;
  st.state_text = "IDLE";
  return st;
}

TickInput at(double t, std::optional<PrinterStatus> st,
             std::optional<std::string> manual = std::nullopt) {
  TickInput in;
  in.now_s = t;
  in.status = std::move(st);
  in.manual_session = std::move(manual);
  return in;
}

pl::TimelapseConfig base_cfg() {
  pl::TimelapseConfig cfg;
  cfg.capture_interval_s = 30;
  cfg.finishing_threshold_pct = 98;
  cfg.finishing_interval_s = 5;
  cfg.post_print_frames = 0;
  cfg.post_print_interval_s = 5;
  cfg.post_print_max_failures = 10;
  cfg.stop_debounce = 3;
  return cfg;
}

}  // namespace

TEST(SessionController, DebouncedStopClosesOnThirdNotActivePoll) {
  FakeHooks hooks;
  SessionController ctl(base_cfg(), 10, hooks);
  SessionControllerState state;

  const std::vector<std::optional<PrinterStatus>> polls = {idle(),     printing(1), printing(1),
                                                           idle(),     idle(),      idle()};
  std::vector<TickResult> results;
  double t = 0.0;
  for (const auto& p : polls) {
    results.push_back(ctl.tick(state, at(t, p)));
    t += 10.0;
  }

  EXPECT_FALSE(results[0].started.has_value());
  ASSERT_TRUE(results[1].started.has_value());
  EXPECT_EQ(results[1].started->job_id.value_or(-1), 1);
  EXPECT_EQ(hooks.opened.size(), 1u);

  EXPECT_FALSE(results[3].finalized.has_value());
  EXPECT_FALSE(results[4].finalized.has_value());
  ASSERT_TRUE(results[5].finalized.has_value());
  EXPECT_FALSE(state.session.has_value());

  ASSERT_EQ(hooks.finalized.size(), 1u);
  EXPECT_EQ(hooks.finalized[0].frame_count, 1);  // tick 3 is within the capture interval
}

TEST(SessionController, SingleBlipDoesNotCloseSession) {
  FakeHooks hooks;
  SessionController ctl(base_cfg(), 10, hooks);
  SessionControllerState state;

  (void)ctl.tick(state, at(0, printing(7)));
  (void)ctl.tick(state, at(10, idle()));
  EXPECT_EQ(state.not_active_count, 1);
  (void)ctl.tick(state, at(20, printing(7)));

  EXPECT_EQ(state.not_active_count, 0);
  ASSERT_TRUE(state.session.has_value());
  EXPECT_TRUE(hooks.finalized.empty());
}

TEST(SessionController, FinishingModeActivatesAtThresholdAndUsesFastInterval) {
  FakeHooks hooks;
  SessionController ctl(base_cfg(), 30, hooks);
  SessionControllerState state;

  const TickResult r0 = ctl.tick(state, at(0, printing(1, 90.0f)));
  EXPECT_TRUE(r0.frame_captured);
  EXPECT_EQ(state.session->mode, SessionMode::kNormal);
  EXPECT_DOUBLE_EQ(r0.sleep_s, 30.0);

  const TickResult r1 = ctl.tick(state, at(10, printing(1, 97.0f)));
  EXPECT_FALSE(r1.frame_captured);
  EXPECT_EQ(state.session->mode, SessionMode::kNormal);

  const TickResult r2 = ctl.tick(state, at(15, printing(1, 99.0f)));
  EXPECT_EQ(state.session->mode, SessionMode::kFinishing);
  EXPECT_TRUE(r2.frame_captured);  // 15s since the last frame >= 5s finishing interval
  EXPECT_DOUBLE_EQ(r2.sleep_s, 5.0);
  EXPECT_EQ(state.session->frame_count, 2);
}

TEST(SessionController, FinishingModeSkipsDebounce) {
  FakeHooks hooks;
  SessionController ctl(base_cfg(), 10, hooks);
  SessionControllerState state;

  (void)ctl.tick(state, at(0, printing(1, 99.0f)));
  ASSERT_EQ(state.session->mode, SessionMode::kFinishing);

  const TickResult r = ctl.tick(state, at(10, idle()));
  ASSERT_TRUE(r.finalized.has_value());
  EXPECT_EQ(r.finalized->frame_count, 1);
}

TEST(SessionController, JobChangeFinalizesAndStartsFreshSession) {
  FakeHooks hooks;
  SessionController ctl(base_cfg(), 10, hooks);
  SessionControllerState state;

  (void)ctl.tick(state, at(0, printing(1)));
  (void)ctl.tick(state, at(30, printing(1)));
  ASSERT_EQ(state.session->frame_count, 2);

  const TickResult r = ctl.tick(state, at(40, printing(2)));
  ASSERT_TRUE(r.finalized.has_value());
  EXPECT_EQ(r.finalized->frame_count, 2);
  EXPECT_EQ(r.finalized->job_id.value_or(-1), 1);

  ASSERT_TRUE(r.started.has_value());
  EXPECT_EQ(state.session->job_id.value_or(-1), 2);
  EXPECT_EQ(state.session->frame_count, 1);  // first frame of the new session, index 0
  EXPECT_EQ(hooks.indices.back(), 0);
}

TEST(SessionController, PausedKeepsSessionOpenWithoutFrames) {
  FakeHooks hooks;
  SessionController ctl(base_cfg(), 10, hooks);
  SessionControllerState state;

  (void)ctl.tick(state, at(0, printing(3)));
  for (int i = 1; i <= 5; ++i) {
    const TickResult r = ctl.tick(state, at(100.0 * i, paused(3)));
    EXPECT_FALSE(r.frame_captured);
    EXPECT_FALSE(r.finalized.has_value());
  }
  EXPECT_EQ(state.session->frame_count, 1);
  EXPECT_EQ(state.not_active_count, 0);
}

TEST(SessionController, OpenSessionReportsLivenessWhilePausedOrOffline) {
  FakeHooks hooks;
  SessionController ctl(base_cfg(), 10, hooks);
  SessionControllerState state;

  (void)ctl.tick(state, at(0, idle()));
  EXPECT_TRUE(hooks.alive_at.empty());

  (void)ctl.tick(state, at(10, printing(3)));
  (void)ctl.tick(state, at(20, paused(3)));
  (void)ctl.tick(state, at(30, std::nullopt));
  (void)ctl.tick(state, at(40, paused(3)));
  EXPECT_EQ(hooks.alive_at, (std::vector<double>{20, 30, 40}));
  EXPECT_EQ(state.session->frame_count, 1);
}

TEST(SessionController, PostPrintCapturesExtraFramesThenFinalizes) {
  pl::TimelapseConfig cfg = base_cfg();
  cfg.post_print_frames = 3;
  FakeHooks hooks;
  SessionController ctl(cfg, 10, hooks);
  SessionControllerState state;

  (void)ctl.tick(state, at(0, printing(1, 99.0f)));  // finishing: no debounce on stop

  TickResult r = ctl.tick(state, at(10, idle()));
  EXPECT_EQ(state.session->mode, SessionMode::kPostPrint);
  EXPECT_TRUE(r.frame_captured);
  EXPECT_DOUBLE_EQ(r.sleep_s, 5.0);

  r = ctl.tick(state, at(12, idle()));  // inside the post-print interval
  EXPECT_FALSE(r.frame_captured);

  r = ctl.tick(state, at(15, idle()));
  EXPECT_TRUE(r.frame_captured);
  EXPECT_FALSE(r.finalized.has_value());

  r = ctl.tick(state, at(20, idle()));
  ASSERT_TRUE(r.finalized.has_value());
  EXPECT_EQ(r.finalized->frame_count, 4);
  EXPECT_FALSE(state.session.has_value());
}

TEST(SessionController, PostPrintAbortsAfterConsecutiveFailures) {
  pl::TimelapseConfig cfg = base_cfg();
  cfg.post_print_frames = 24;
  cfg.post_print_max_failures = 2;
  FakeHooks hooks;
  SessionController ctl(cfg, 10, hooks);
  SessionControllerState state;

  (void)ctl.tick(state, at(0, printing(1, 99.0f)));
  hooks.capture_ok = false;

  TickResult r = ctl.tick(state, at(10, idle()));
  EXPECT_TRUE(r.capture_failed);
  EXPECT_FALSE(r.finalized.has_value());

  r = ctl.tick(state, at(15, idle()));
  ASSERT_TRUE(r.finalized.has_value());
  EXPECT_EQ(r.finalized->frame_count, 1);
  ASSERT_EQ(hooks.finalized.size(), 1u);
}

TEST(SessionController, ManualRequestEndsPostPrintEarly) {
  pl::TimelapseConfig cfg = base_cfg();
  cfg.post_print_frames = 24;
  FakeHooks hooks;
  SessionController ctl(cfg, 10, hooks);
  SessionControllerState state;

  (void)ctl.tick(state, at(0, printing(1, 99.0f)));
  (void)ctl.tick(state, at(10, idle()));
  ASSERT_EQ(state.session->mode, SessionMode::kPostPrint);

  TickResult r = ctl.tick(state, at(12, idle(), std::string("calibration run")));
  ASSERT_TRUE(r.finalized.has_value());
  EXPECT_DOUBLE_EQ(r.sleep_s, 1.0);
  EXPECT_FALSE(state.session.has_value());

  r = ctl.tick(state, at(13, idle(), std::string("calibration run")));
  ASSERT_TRUE(r.started.has_value());
  EXPECT_EQ(r.started->name, "calibration_run");
  EXPECT_EQ(r.started->origin, pl::SessionOrigin::kManual);
  EXPECT_FALSE(r.started->job_id.has_value());
  EXPECT_TRUE(r.frame_captured);
}

TEST(SessionController, ManualSessionCapturesWhilePrinterIdle) {
  FakeHooks hooks;
  SessionController ctl(base_cfg(), 10, hooks);
  SessionControllerState state;

  TickResult r = ctl.tick(state, at(0, idle(), std::string("desk")));
  ASSERT_TRUE(r.started.has_value());
  EXPECT_TRUE(r.frame_captured);

  r = ctl.tick(state, at(30, idle(), std::string("desk")));
  EXPECT_TRUE(r.frame_captured);
  EXPECT_EQ(state.session->frame_count, 2);
}

TEST(SessionController, StatusUnavailableChangesNothing) {
  FakeHooks hooks;
  SessionController ctl(base_cfg(), 10, hooks);
  SessionControllerState state;

  (void)ctl.tick(state, at(0, printing(1)));
  const TickResult r = ctl.tick(state, at(10, std::nullopt));
  EXPECT_DOUBLE_EQ(r.sleep_s, 10.0);
  EXPECT_EQ(state.not_active_count, 0);
  ASSERT_TRUE(state.session.has_value());
}

TEST(SessionController, OpenFailureLeavesControllerIdle) {
  FakeHooks hooks;
  hooks.open_status = Status::io_error("no storage");
  SessionController ctl(base_cfg(), 10, hooks);
  SessionControllerState state;

  const TickResult r = ctl.tick(state, at(0, printing(1)));
  EXPECT_FALSE(r.started.has_value());
  EXPECT_FALSE(state.session.has_value());
  EXPECT_TRUE(hooks.indices.empty());
}

TEST(SessionController, ZeroFrameSessionIsNotQueued) {
  FakeHooks hooks;
  hooks.capture_ok = false;
  SessionController ctl(base_cfg(), 10, hooks);
  SessionControllerState state;

  (void)ctl.tick(state, at(0, printing(1)));
  auto closed = ctl.finalize(state, "shutdown");
  ASSERT_TRUE(closed.has_value());
  EXPECT_EQ(closed->frame_count, 0);
  EXPECT_TRUE(hooks.finalized.empty());
}

TEST(SessionController, SessionNames) {
  std::tm tm{};
  tm.tm_year = 2025 - 1900;
  tm.tm_mon = 0;
  tm.tm_mday = 14;
  tm.tm_hour = 9;
  tm.tm_min = 30;
  tm.tm_sec = 5;
  tm.tm_isdst = -1;
  const auto wall = std::chrono::system_clock::from_time_t(std::mktime(&tm));

  EXPECT_EQ(SessionController::make_session_name(std::string("Benchy v2.gcode"), wall),
            "20250114_093005_Benchy_v2_gcode");
  EXPECT_EQ(SessionController::make_session_name(std::nullopt, wall), "print_20250114_093005");
  EXPECT_EQ(SessionController::make_session_name(std::string(), wall), "print_20250114_093005");
}
