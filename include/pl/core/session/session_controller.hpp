// File: include/pl/core/session/session_controller.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "pl/core/config.hpp"
#include "pl/core/status.hpp"
#include "pl/core/types.hpp"

namespace pl {

// Side effects the controller asks for. Implemented by the capture daemon (and by fakes
// in tests).
class SessionHooks {
 public:
  virtual ~SessionHooks() = default;

  // Create the session's storage. An error leaves the controller idle; it retries next tick.
  virtual Status open_session(const Session& session) = 0;

  // Capture and store frame `index`. Returns true when the frame was stored.
  virtual bool capture_frame(const Session& session, int index) = 0;

  // Hand the session over to the encoder (ready marker). Only called with >= 1 frame.
  virtual Status finalize_session(const Session& session) = 0;

  // Called on every tick while a session is open, paused or not.
  virtual void session_alive(const Session& /*session*/, double /*now_s*/) {}
};

// Every mutable counter of the recording state machine. Owned by the caller and threaded
// through SessionController::tick().
struct SessionControllerState {
  std::optional<Session> session;

  // Consecutive polls where the session should no longer be kept open.
  int not_active_count = 0;

  // Monotonic seconds of the last capture attempt. nullopt => capture immediately.
  std::optional<double> last_capture_s;

  // Post-print extension.
  int post_print_captured = 0;
  int post_print_failures = 0;
  std::optional<double> post_print_last_s;

  // Per-session capture statistics.
  int capture_success = 0;
  int capture_failed = 0;
};

struct TickInput {
  // nullopt when the status query failed.
  std::optional<PrinterStatus> status;

  // Name from the manual control signal, if present.
  std::optional<SessionName> manual_session;

  // Monotonic seconds (any origin).
  double now_s = 0.0;

  // Used for session naming only.
  std::chrono::system_clock::time_point wall = std::chrono::system_clock::now();
};

struct TickResult {
  // How long the caller should wait before the next tick.
  double sleep_s = 0.0;

  std::optional<Session> started;
  std::optional<Session> finalized;

  bool frame_captured = false;
  bool capture_failed = false;
};

class SessionController {
 public:
  SessionController(TimelapseConfig cfg, int poll_interval_s, SessionHooks& hooks);

  TickResult tick(SessionControllerState& state, const TickInput& in);

  // Close whatever is open (shutdown path). Returns the finalized session, if any.
  std::optional<Session> finalize(SessionControllerState& state, const char* reason);

  // "YYYYmmdd_HHMMSS_<job>" or "print_YYYYmmdd_HHMMSS" (local time).
  static SessionName make_session_name(const std::optional<std::string>& job_name,
                                       std::chrono::system_clock::time_point wall);

  const TimelapseConfig& config() const { return cfg_; }

 private:
  double sleep_for(const SessionControllerState& state) const;
  bool start(SessionControllerState& state, const TickInput& in, TickResult& out);
  void capture(SessionControllerState& state, TickResult& out);
  // False when post-print was cut short by a different manual session.
  bool tick_post_print(SessionControllerState& state, const TickInput& in, TickResult& out);
  void reset(SessionControllerState& state) const;

  TimelapseConfig cfg_;
  double poll_s_;
  SessionHooks& hooks_;
};

}  // namespace pl
