// File: src/core/session/session_controller.cpp
#include "pl/core/session/session_controller.hpp"

#include <algorithm>
#include <ctime>
#include <utility>

#include <spdlog/spdlog.h>

#include "pl/core/util/fs_util.hpp"

namespace pl {
namespace {

double rate_pct(int success, int failed) {
  const int total = success + failed;
  return total > 0 ? 100.0 * static_cast<double>(success) / static_cast<double>(total) : 0.0;
}

}  // namespace

SessionController::SessionController(TimelapseConfig cfg, int poll_interval_s, SessionHooks& hooks)
    : cfg_(std::move(cfg)), poll_s_(static_cast<double>(poll_interval_s)), hooks_(hooks) {}

SessionName SessionController::make_session_name(const std::optional<std::string>& job_name,
                                                 std::chrono::system_clock::time_point wall) {
  const std::time_t t = std::chrono::system_clock::to_time_t(wall);
  std::tm tm{};
  localtime_r(&t, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

  if (job_name && !job_name->empty()) return std::string(stamp) + "_" + sanitize_name(*job_name);
  return std::string("print_") + stamp;
}

void SessionController::reset(SessionControllerState& state) const {
  state = SessionControllerState{};
}

double SessionController::sleep_for(const SessionControllerState& state) const {
  double interval = static_cast<double>(cfg_.capture_interval_s);
  if (state.session) {
    if (state.session->mode == SessionMode::kPostPrint) {
      interval = static_cast<double>(cfg_.post_print_interval_s);
    } else if (state.session->mode == SessionMode::kFinishing) {
      interval = static_cast<double>(cfg_.finishing_interval_s);
    }
  }
  return std::min(poll_s_, interval);
}

std::optional<Session> SessionController::finalize(SessionControllerState& state,
                                                   const char* reason) {
  if (!state.session) return std::nullopt;
  Session s = *state.session;

  const int attempts = state.capture_success + state.capture_failed;
  spdlog::info("[SessionController] recording stopped ({}): {} with {} frames", reason, s.name,
               s.frame_count);
  if (attempts > 0) {
    spdlog::info("[SessionController] session capture rate: {:.1f}% ({}/{})",
                 rate_pct(state.capture_success, state.capture_failed), state.capture_success,
                 attempts);
  }

  if (s.frame_count > 0) {
    const Status st = hooks_.finalize_session(s);
    if (!st.ok()) {
      spdlog::error("[SessionController] could not queue {} for encoding: {}", s.name, st.message());
    }
  } else {
    spdlog::warn("[SessionController] {} has no frames; not queued for encoding", s.name);
  }

  reset(state);
  return s;
}

bool SessionController::start(SessionControllerState& state, const TickInput& in, TickResult& out) {
  Session s;
  if (in.manual_session) {
    s.name = sanitize_name(*in.manual_session);
    s.origin = SessionOrigin::kManual;
  } else {
    s.name = make_session_name(in.status->job_name, in.wall);
    s.job_id = in.status->job_id;
    s.origin = SessionOrigin::kAuto;
  }

  const Status st = hooks_.open_session(s);
  if (!st.ok()) {
    spdlog::error("[SessionController] cannot open session {}: {}", s.name, st.message());
    return false;
  }

  reset(state);
  state.session = s;
  out.started = s;

  if (s.origin == SessionOrigin::kManual) {
    spdlog::info("[SessionController] recording started (manual): {}", s.name);
  } else if (s.job_id) {
    spdlog::info("[SessionController] recording started (auto, job {}): {}", *s.job_id, s.name);
  } else {
    spdlog::info("[SessionController] recording started (auto): {}", s.name);
  }
  return true;
}

void SessionController::capture(SessionControllerState& state, TickResult& out) {
  Session& s = *state.session;

  if (hooks_.capture_frame(s, s.frame_count)) {
    ++s.frame_count;
    ++state.capture_success;
    out.frame_captured = true;
    spdlog::debug("[SessionController] frame {} captured ({})", s.frame_count, to_string(s.mode));
  } else {
    ++state.capture_failed;
    out.capture_failed = true;
  }

  const int attempts = state.capture_success + state.capture_failed;
  if (attempts % 100 == 0) {
    spdlog::info("[SessionController] capture rate: {:.1f}% ({}/{})",
                 rate_pct(state.capture_success, state.capture_failed), state.capture_success,
                 attempts);
  }
}

bool SessionController::tick_post_print(SessionControllerState& state, const TickInput& in,
                                        TickResult& out) {
  Session& s = *state.session;

  if (in.manual_session && sanitize_name(*in.manual_session) != s.name) {
    spdlog::info("[SessionController] manual session requested; ending post-print capture of {} "
                 "after {} frames",
                 s.name, state.post_print_captured);
    out.finalized = finalize(state, "manual session requested");
    return false;
  }

  if (state.post_print_last_s &&
      in.now_s - *state.post_print_last_s < static_cast<double>(cfg_.post_print_interval_s)) {
    return true;
  }
  state.post_print_last_s = in.now_s;

  if (hooks_.capture_frame(s, s.frame_count)) {
    ++s.frame_count;
    ++state.capture_success;
    ++state.post_print_captured;
    state.post_print_failures = 0;
    out.frame_captured = true;
    spdlog::debug("[SessionController] post-print frame {}/{} captured", state.post_print_captured,
                  cfg_.post_print_frames);
  } else {
    ++state.capture_failed;
    ++state.post_print_failures;
    out.capture_failed = true;
    if (state.post_print_failures >= cfg_.post_print_max_failures) {
      spdlog::warn("[SessionController] post-print capture aborted after {} consecutive failures "
                   "({}/{} frames)",
                   state.post_print_failures, state.post_print_captured, cfg_.post_print_frames);
      out.finalized = finalize(state, "post-print failures");
      return true;
    }
  }

  if (state.post_print_captured >= cfg_.post_print_frames) {
    out.finalized = finalize(state, "post-print complete");
  }
  return true;
}

TickResult SessionController::tick(SessionControllerState& state, const TickInput& in) {
  TickResult out;
  out.sleep_s = poll_s_;

  if (state.session) hooks_.session_alive(*state.session, in.now_s);

  if (!in.status) {
    spdlog::warn("[SessionController] printer status unavailable; retrying in {:.0f}s", poll_s_);
    return out;
  }
  const PrinterStatus& st = *in.status;

  const bool manual = in.manual_session.has_value();
  const bool keep_open = st.is_job_active || manual;
  const bool should_capture = st.is_printing || manual;

  // Debounce the stop decision. Finishing mode is trusted and closes at once.
  if (!keep_open && state.session && !manual && state.session->mode == SessionMode::kNormal) {
    ++state.not_active_count;
    if (state.not_active_count < cfg_.stop_debounce) {
      spdlog::debug("[SessionController] job not active ({}), {}/{} before stopping", st.state_text,
                    state.not_active_count, cfg_.stop_debounce);
      out.sleep_s = sleep_for(state);
      return out;
    }
  } else {
    state.not_active_count = 0;
  }

  // A new job while recording: close the old session without debounce.
  if (state.session && state.session->job_id && st.job_id && *st.job_id != *state.session->job_id) {
    spdlog::info("[SessionController] job changed ({} -> {})", *state.session->job_id, *st.job_id);
    out.finalized = finalize(state, "job changed");
  }

  if (keep_open && !state.session) {
    if (!start(state, in, out)) return out;
  } else if (!keep_open && state.session && state.session->mode != SessionMode::kPostPrint) {
    if (cfg_.post_print_frames > 0) {
      state.session->mode = SessionMode::kPostPrint;
      state.post_print_captured = 0;
      state.post_print_failures = 0;
      state.post_print_last_s.reset();
      spdlog::info("[SessionController] print finished; capturing {} post-print frames",
                   cfg_.post_print_frames);
    } else {
      out.finalized = finalize(state, "print ended");
    }
  }

  if (state.session && state.session->mode == SessionMode::kPostPrint) {
    // The manual session is picked up on the next (short) tick.
    out.sleep_s = tick_post_print(state, in, out) ? sleep_for(state) : 1.0;
    return out;
  }

  if (state.session && should_capture) {
    const float progress = st.progress_percent.value_or(0.0f);
    const bool finishing = progress >= static_cast<float>(cfg_.finishing_threshold_pct);
    if (finishing && state.session->mode != SessionMode::kFinishing) {
      spdlog::info("[SessionController] finishing mode at {:.1f}%: capturing every {}s", progress,
                   cfg_.finishing_interval_s);
    }
    state.session->mode = finishing ? SessionMode::kFinishing : SessionMode::kNormal;

    const double interval = static_cast<double>(finishing ? cfg_.finishing_interval_s
                                                          : cfg_.capture_interval_s);
    if (!state.last_capture_s || in.now_s - *state.last_capture_s >= interval) {
      capture(state, out);
      state.last_capture_s = in.now_s;
    }
  } else if (state.session) {
    spdlog::debug("[SessionController] session open, paused ({}): {} frames", st.state_text,
                  state.session->frame_count);
  }

  out.sleep_s = sleep_for(state);
  return out;
}

}  // namespace pl
