// File: include/pl/core/capture/capture_service.hpp
#pragma once

#include <optional>

#include "pl/core/config.hpp"
#include "pl/core/events/event_sink.hpp"
#include "pl/core/io/frame_source.hpp"
#include "pl/core/model/service_runner.hpp"
#include "pl/core/session/session_controller.hpp"
#include "pl/core/storage/dual_tier_store.hpp"
#include "pl/core/storage/mount_monitor.hpp"

namespace pl {

// Wires the session state machine to a camera, the dual-tier store and the event trail.
class CaptureService final : public SessionHooks {
 public:
  CaptureService(const Config& cfg, IFrameSource& source, DualTierStore& store,
                 IMountMonitor& mount, ServiceRunner& runner, EventSink& sink);

  Status open_session(const Session& session) override;
  bool capture_frame(const Session& session, int index) override;
  Status finalize_session(const Session& session) override;

  // Refreshes the capture heartbeat, at most once per printer poll interval.
  void session_alive(const Session& session, double now_s) override;

  // Probe the primary; remount when it stays down across two checks. Reconciles on
  // recovery. Runs at most once per `mount.check_interval_s` unless `force` is set.
  void check_primary(double now_s, bool force = false);

  int frames_dropped() const { return frames_dropped_; }

 private:
  void emit(const char* type, const std::string& message, const SessionName& session = {},
            std::optional<int> frame_count = std::nullopt);

  const Config& cfg_;
  IFrameSource& source_;
  DualTierStore& store_;
  IMountMonitor& mount_;
  ServiceRunner& runner_;
  EventSink& sink_;

  std::optional<double> last_check_s_;
  std::optional<double> last_alive_s_;
  int frames_dropped_ = 0;
};

}  // namespace pl
