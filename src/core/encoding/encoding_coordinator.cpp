// File: src/core/encoding/encoding_coordinator.cpp
#include "pl/core/encoding/encoding_coordinator.hpp"

#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "pl/core/encoding/session_log.hpp"
#include "pl/core/storage/session_markers.hpp"
#include "pl/core/util/fs_util.hpp"

namespace pl {
namespace fs = std::filesystem;

EncodingCoordinator::EncodingCoordinator(const Config& cfg, IMountMonitor& mount,
                                         VideoEncoder& encoder)
    : root_(cfg.storage.primary_root),
      frame_ext_(cfg.storage.frame_ext),
      probe_timeout_(cfg.encoder.health_probe_timeout_s),
      mount_(mount),
      encoder_(encoder) {}

std::vector<fs::path> EncodingCoordinator::find_pending_sessions() const {
  std::vector<fs::path> pending;

  auto dirs = list_session_dirs(root_);
  if (!dirs.ok()) {
    spdlog::error("[EncodingCoordinator] cannot scan {}: {}", root_.string(), dirs.status().message());
    return pending;
  }

  const std::string& video_ext = encoder_.config().video_ext;
  for (const fs::path& dir : *dirs) {
    auto snap = inspect_session(dir, frame_ext_, video_ext);
    if (!snap.ok()) continue;
    if (snap->has_ready && !snap->has_in_progress && !snap->has_complete && !snap->has_failed &&
        !snap->has_video) {
      pending.push_back(dir);
    }
  }
  return pending;  // list_session_dirs is already sorted
}

Result<bool> EncodingCoordinator::claim(const fs::path& session_dir) const {
  return pl::claim(session_dir);
}

RecoveryReport EncodingCoordinator::recover_stale(std::chrono::seconds max_age) const {
  RecoveryReport report;

  auto dirs = list_session_dirs(root_);
  if (!dirs.ok()) return report;

  for (const fs::path& dir : *dirs) {
    if (active_ && active_->session_dir == dir) continue;
    if (!has_marker(dir, Marker::kEncodingInProgress)) continue;

    auto age = file_age(marker_path(dir, Marker::kEncodingInProgress));
    if (!age.ok() || *age < max_age) continue;

    const SessionLog log(dir);
    log.info("Recovering stale session (in progress for " + std::to_string(age->count() / 60) +
             " min)");

    std::error_code ec;
    const fs::path video = layout::video_path(dir, encoder_.config().video_ext);
    if (fs::remove(video, ec)) log.info("Deleted incomplete video: " + video.filename().string());
    if (ec) spdlog::warn("[EncodingCoordinator] could not delete {}: {}", video.string(), ec.message());

    auto reset = reset_to_ready(dir);
    if (!reset.ok()) {
      spdlog::error("[EncodingCoordinator] {}", reset.status().message());
      continue;
    }
    if (*reset) ++report.reset_to_ready;
  }

  if (report.reset_to_ready > 0) {
    spdlog::info("[EncodingCoordinator] re-queued {} stale sessions", report.reset_to_ready);
  }
  return report;
}

RecoveryReport EncodingCoordinator::recover_abandoned(std::chrono::seconds min_idle) const {
  RecoveryReport report;

  auto dirs = list_session_dirs(root_);
  if (!dirs.ok()) return report;

  for (const fs::path& dir : *dirs) {
    auto snap_r = inspect_session(dir, frame_ext_, encoder_.config().video_ext);
    if (!snap_r.ok()) continue;
    const SessionSnapshot& snap = *snap_r;

    if (snap.has_complete || snap.has_failed) {
      if (snap.has_ready) {
        std::error_code ec;
        fs::remove(marker_path(dir, Marker::kReadyForEncoding), ec);
        if (!ec) ++report.stray_removed;
      }
      continue;
    }
    if (snap.has_in_progress || snap.has_ready) continue;

    if (snap.has_video) {
      const Status st = mark_complete(dir);
      if (st.ok()) {
        ++report.marked_complete;
        spdlog::info("[EncodingCoordinator] {} already has a video; marked complete", snap.name);
      }
      continue;
    }
    if (snap.frame_count == 0) continue;

    // Newest frame or capture heartbeat decides whether capture still holds the session.
    // A paused print keeps touching the heartbeat without writing frames.
    auto frames = list_frames(layout::frames_dir(dir), frame_ext_);
    if (!frames.ok() || frames->empty()) continue;
    auto idle = file_age(frames->back());
    if (!idle.ok() || *idle < min_idle) continue;
    const fs::path heartbeat = layout::capture_heartbeat(dir);
    auto alive = file_age(heartbeat);
    if (alive.ok() && *alive < min_idle) continue;

    std::error_code ec;
    fs::remove(heartbeat, ec);
    if (ec) spdlog::warn("[EncodingCoordinator] could not remove {}: {}", heartbeat.string(), ec.message());

    const Status st = mark_ready(dir);
    if (!st.ok()) {
      spdlog::warn("[EncodingCoordinator] could not queue abandoned {}: {}", snap.name, st.message());
      continue;
    }
    ++report.marked_ready;
    spdlog::info("[EncodingCoordinator] queued abandoned session {} ({} frames)", snap.name,
                 snap.frame_count);
  }
  return report;
}

CoordinatorTick EncodingCoordinator::tick() {
  CoordinatorTick out;

  if (active_) {
    out.session = active_->session;
    auto done = encoder_.poll(*active_);
    if (!done) {
      out.busy = true;
      return out;
    }
    out.finished = encoder_.finish(*active_, *done);
    spdlog::info("[EncodingCoordinator] {} finished: {}", out.session, to_string(*out.finished));
    active_.reset();
    return out;
  }

  if (!mount_.is_healthy(probe_timeout_)) {
    spdlog::warn("[EncodingCoordinator] primary store unavailable, skipping");
    return out;
  }

  const auto pending = find_pending_sessions();
  if (pending.empty()) return out;

  if (!mount_.is_writable(probe_timeout_)) {
    spdlog::warn("[EncodingCoordinator] primary store not writable, {} sessions waiting",
                 pending.size());
    return out;
  }

  for (const fs::path& dir : pending) {
    const SessionName name = dir.filename().string();

    auto frames = list_frames(layout::frames_dir(dir), frame_ext_);
    if (!frames.ok()) {
      spdlog::error("[EncodingCoordinator] {}: {}", name, frames.status().message());
      continue;
    }
    if (frames->empty()) {
      SessionLog(dir).error("No frames found in session");
      const Status st = encoder_.mark_terminal(dir, false);
      if (!st.ok()) spdlog::error("[EncodingCoordinator] {}: {}", name, st.message());
      continue;
    }

    auto claimed = claim(dir);
    if (!claimed.ok()) {
      spdlog::error("[EncodingCoordinator] claim failed for {}: {}", name, claimed.status().message());
      continue;
    }
    if (!*claimed) continue;

    auto job_r = encoder_.prepare(dir);
    if (!job_r.ok()) {
      SessionLog(dir).error(job_r.status().message());
      if (job_r.status().code() == Status::Code::kNotFound) {
        const Status st = encoder_.mark_terminal(dir, false);
        if (!st.ok()) spdlog::error("[EncodingCoordinator] {}: {}", name, st.message());
        continue;
      }
      // Scratch trouble is local; retry on a later tick.
      auto reset = reset_to_ready(dir);
      if (!reset.ok()) spdlog::error("[EncodingCoordinator] {}", reset.status().message());
      return out;
    }

    EncodeJob job = job_r.take_value();
    const Status st = encoder_.start(job);
    if (!st.ok()) {
      auto reset = reset_to_ready(dir);
      if (!reset.ok()) spdlog::error("[EncodingCoordinator] {}", reset.status().message());
      return out;
    }

    out.session = name;
    out.started = true;
    out.busy = true;
    active_.emplace(std::move(job));
    return out;
  }
  return out;
}

void EncodingCoordinator::abort_active() {
  if (!active_) return;

  spdlog::warn("[EncodingCoordinator] stopping encode of {}", active_->session);
  (void)active_->child.kill(/*timed_out=*/false);

  auto reset = reset_to_ready(active_->session_dir);
  if (!reset.ok()) spdlog::error("[EncodingCoordinator] {}", reset.status().message());
  active_.reset();
}

}  // namespace pl
