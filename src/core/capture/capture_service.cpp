// File: src/core/capture/capture_service.cpp
#include "pl/core/capture/capture_service.hpp"

#include <chrono>
#include <string>

#include <spdlog/spdlog.h>

namespace pl {

CaptureService::CaptureService(const Config& cfg, IFrameSource& source, DualTierStore& store,
                               IMountMonitor& mount, ServiceRunner& runner, EventSink& sink)
    : cfg_(cfg), source_(source), store_(store), mount_(mount), runner_(runner), sink_(sink) {}

void CaptureService::emit(const char* type, const std::string& message, const SessionName& session,
                          std::optional<int> frame_count) {
  runner_.record_event(sink_, type, message, session, frame_count);
}

Status CaptureService::open_session(const Session& session) {
  auto tier = store_.open_session(session.name);
  if (!tier.ok()) return tier.status();

  emit("session_started", std::string(to_string(session.origin)) + " on " + to_string(*tier),
       session.name, 0);
  return Status::ok_status();
}

bool CaptureService::capture_frame(const Session& session, int index) {
  auto shot = source_.capture();
  if (!shot.ok()) {
    ++frames_dropped_;
    spdlog::warn("[CaptureService] capture failed ({}): {}", source_.name(), shot.status().message());
    emit("frame_dropped", "capture: " + shot.status().message(), session.name, index);
    return false;
  }

  auto tier = store_.write_frame(session.name, index, *shot);
  if (!tier.ok()) {
    ++frames_dropped_;
    if (tier.status().code() != Status::Code::kResourceExhausted) {
      spdlog::warn("[CaptureService] frame {} of {} not stored: {}", index, session.name,
                   tier.status().message());
    }
    emit("frame_dropped", std::string(status_code_name(tier.status().code())) + ": " +
                              tier.status().message(),
         session.name, index);
    return false;
  }

  if (*tier == StoreTier::kFallback) {
    spdlog::debug("[CaptureService] frame {} of {} saved locally", index, session.name);
  }
  return true;
}

void CaptureService::session_alive(const Session& session, double now_s) {
  if (last_alive_s_ && now_s - *last_alive_s_ < static_cast<double>(cfg_.printer.poll_interval_s)) {
    return;
  }
  last_alive_s_ = now_s;

  const Status st = store_.touch_live(session.name);
  if (!st.ok()) {
    spdlog::warn("[CaptureService] capture heartbeat for {} not written: {}", session.name, st.message());
  }
}

Status CaptureService::finalize_session(const Session& session) {
  last_alive_s_.reset();
  auto tier = store_.mark_ready(session.name);
  if (!tier.ok()) {
    emit("session_finalized", "ready marker failed: " + tier.status().message(), session.name,
         session.frame_count);
    return tier.status();
  }
  emit("session_finalized", std::string("ready on ") + to_string(*tier), session.name,
       session.frame_count);
  return Status::ok_status();
}

void CaptureService::check_primary(double now_s, bool force) {
  if (!force && last_check_s_ &&
      now_s - *last_check_s_ < static_cast<double>(cfg_.mount.check_interval_s)) {
    return;
  }
  last_check_s_ = now_s;

  const bool was_healthy = store_.primary_healthy();
  bool healthy = mount_.is_healthy(std::chrono::seconds(cfg_.mount.probe_timeout_s));

  // Down on the previous check too: the mount is stale rather than flapping.
  if (!healthy && !was_healthy) healthy = mount_.try_remount();

  if (healthy != was_healthy) {
    emit("primary_state", healthy ? "healthy" : "unhealthy");
  }

  const auto report = store_.set_primary_healthy(healthy);
  if (report) {
    emit("reconcile",
         std::to_string(report->frames_transferred) + " frames, " +
             std::to_string(report->sessions_completed) + " sessions" +
             (report->finished ? "" : ", stopped: " + report->stopped_reason));
  }
}

}  // namespace pl
