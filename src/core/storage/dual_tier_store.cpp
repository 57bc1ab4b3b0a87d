// File: src/core/storage/dual_tier_store.cpp
#include "pl/core/storage/dual_tier_store.hpp"

#include <atomic>
#include <memory>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "pl/core/storage/session_markers.hpp"
#include "pl/core/util/deadline.hpp"
#include "pl/core/util/fs_util.hpp"

namespace pl {
namespace fs = std::filesystem;

namespace {

Status create_dirs(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) return Status::io_error("cannot create " + dir.string() + ": " + ec.message());
  return Status::ok_status();
}

// statvfs needs an existing path; the fallback root may not exist yet.
fs::path nearest_existing(fs::path p) {
  std::error_code ec;
  while (!p.empty() && !fs::exists(p, ec)) {
    const fs::path parent = p.parent_path();
    if (parent == p) break;
    p = parent;
  }
  return p.empty() ? fs::path("/") : p;
}

}  // namespace

DualTierStore::DualTierStore(StorageConfig cfg, FreeSpaceProbe free_space)
    : cfg_(std::move(cfg)),
      primary_root_(cfg_.primary_root),
      fallback_root_(cfg_.fallback_root),
      copy_timeout_(cfg_.copy_timeout_s),
      free_space_(free_space ? std::move(free_space) : FreeSpaceProbe(&free_space_mb)) {}

void DualTierStore::mark_primary_down(const std::string& why) {
  if (primary_healthy_) {
    spdlog::warn("[DualTierStore] primary unavailable ({}); switching to local storage at {}", why,
                 fallback_root_.string());
  }
  primary_healthy_ = false;
}

Status DualTierStore::write_primary(const fs::path& dst, const fs::path& source) {
  return run_with_deadline(
      [dst, source]() -> Status {
        PL_RETURN_IF_ERROR(create_dirs(dst.parent_path()));
        return copy_file_atomic(source, dst);
      },
      copy_timeout_, "primary copy of " + dst.filename().string());
}

Result<StoreTier> DualTierStore::write_fallback(const fs::path& dst, const fs::path& source) {
  auto free_r = free_space_(nearest_existing(fallback_root_));
  if (!free_r.ok()) return Result<StoreTier>::err(free_r.status());

  if (*free_r < cfg_.min_free_mb) {
    if (!disk_full_warned_) {
      spdlog::error("[DualTierStore] local disk low on space ({} MB free, need {} MB); dropping frames",
                    *free_r, cfg_.min_free_mb);
      disk_full_warned_ = true;
    }
    return Result<StoreTier>::err(Status::resource_exhausted(
        "local free space " + std::to_string(*free_r) + " MB below margin"));
  }
  if (disk_full_warned_) {
    spdlog::info("[DualTierStore] local free space recovered ({} MB)", *free_r);
    disk_full_warned_ = false;
  }

  Status st = create_dirs(dst.parent_path());
  if (st.ok()) st = copy_file_atomic(source, dst);
  if (!st.ok()) {
    spdlog::error("[DualTierStore] local fallback save failed: {}", st.message());
    return Result<StoreTier>::err(st);
  }
  return Result<StoreTier>::ok(StoreTier::kFallback);
}

Result<StoreTier> DualTierStore::open_session(const SessionName& session) {
  if (primary_healthy_) {
    const fs::path dir = layout::frames_dir(layout::session_dir(primary_root_, session));
    const Status st = run_with_deadline([dir]() { return create_dirs(dir); }, copy_timeout_,
                                        "create " + session);
    if (st.ok()) return Result<StoreTier>::ok(StoreTier::kPrimary);
    mark_primary_down(st.message());
  }

  const Status st = create_dirs(layout::frames_dir(layout::session_dir(fallback_root_, session)));
  if (!st.ok()) return Result<StoreTier>::err(st);
  return Result<StoreTier>::ok(StoreTier::kFallback);
}

Result<StoreTier> DualTierStore::write_frame(const SessionName& session, int index,
                                             const fs::path& source) {
  const std::string name = frame_filename(index, cfg_.frame_ext);

  if (primary_healthy_) {
    const fs::path dst = layout::frames_dir(layout::session_dir(primary_root_, session)) / name;
    const Status st = write_primary(dst, source);
    if (st.ok()) return Result<StoreTier>::ok(StoreTier::kPrimary);
    mark_primary_down(st.message());
  }

  return write_fallback(layout::frames_dir(layout::session_dir(fallback_root_, session)) / name,
                        source);
}

bool DualTierStore::fallback_has_frames(const SessionName& session) const {
  auto frames = list_frames(layout::frames_dir(layout::session_dir(fallback_root_, session)),
                            cfg_.frame_ext);
  return frames.ok() && !frames->empty();
}

Status DualTierStore::touch_live(const SessionName& session) {
  if (!primary_healthy_) return Status::ok_status();
  const fs::path dir = layout::session_dir(primary_root_, session);
  const Status st = run_with_deadline(
      [dir]() -> Status {
        PL_RETURN_IF_ERROR(create_dirs(dir));
        return touch_file(layout::capture_heartbeat(dir));
      },
      copy_timeout_, "capture heartbeat for " + session);
  if (!st.ok()) mark_primary_down(st.message());
  return st;
}

Status DualTierStore::close_on_primary(const fs::path& dir) {
  const std::string frame_ext = cfg_.frame_ext;
  auto requeued = std::make_shared<std::atomic<bool>>(false);
  const Status st = run_with_deadline(
      [dir, frame_ext, requeued]() -> Status {
        PL_RETURN_IF_ERROR(create_dirs(dir));
        auto closed = close_capture(dir, frame_ext);
        if (!closed.ok()) return closed.status();
        requeued->store(*closed);
        return Status::ok_status();
      },
      copy_timeout_, "ready marker for " + dir.filename().string());
  if (st.ok() && requeued->load()) {
    spdlog::warn("[DualTierStore] {} was encoded before its last frames arrived; re-queued",
                 dir.filename().string());
  }
  return st;
}

Result<StoreTier> DualTierStore::mark_ready(const SessionName& session) {
  if (primary_healthy_ && !fallback_has_frames(session)) {
    const Status st = close_on_primary(layout::session_dir(primary_root_, session));
    if (st.ok()) return Result<StoreTier>::ok(StoreTier::kPrimary);
    mark_primary_down(st.message());
  }

  // Marked locally; reconcile() recreates it on primary once the frames are across.
  const fs::path local = layout::session_dir(fallback_root_, session);
  Status st = create_dirs(local);
  if (st.ok()) st = pl::mark_ready(local);
  if (!st.ok()) return Result<StoreTier>::err(st);
  return Result<StoreTier>::ok(StoreTier::kFallback);
}

bool DualTierStore::has_fallback_data() const {
  auto sessions = list_session_dirs(fallback_root_);
  return sessions.ok() && !sessions->empty();
}

std::optional<ReconcileReport> DualTierStore::set_primary_healthy(bool healthy) {
  const bool was_healthy = primary_healthy_;
  if (!healthy) {
    mark_primary_down("health probe failed");
    return std::nullopt;
  }

  primary_healthy_ = true;
  if (was_healthy) return std::nullopt;

  spdlog::info("[DualTierStore] primary is back online");
  if (!has_fallback_data()) return std::nullopt;
  return reconcile();
}

ReconcileReport DualTierStore::reconcile() {
  ReconcileReport report;

  auto stop = [&report](std::string why) {
    report.finished = false;
    report.stopped_reason = std::move(why);
    spdlog::warn("[DualTierStore] reconcile stopped: {} (will retry later)", report.stopped_reason);
    return report;
  };

  if (!primary_healthy_) return stop("primary unhealthy");

  auto sessions_r = list_session_dirs(fallback_root_);
  if (!sessions_r.ok()) return stop(sessions_r.status().message());

  for (const fs::path& local_dir : *sessions_r) {
    const SessionName session = local_dir.filename().string();

    auto frames_r = list_frames(layout::frames_dir(local_dir), cfg_.frame_ext);
    if (!frames_r.ok()) return stop(frames_r.status().message());
    const bool has_ready = has_marker(local_dir, Marker::kReadyForEncoding);

    std::error_code ec;
    if (frames_r->empty() && !has_ready) {
      fs::remove_all(local_dir, ec);
      if (ec) spdlog::warn("[DualTierStore] cannot remove empty {}: {}", local_dir.string(), ec.message());
      continue;
    }

    const fs::path primary_dir = layout::session_dir(primary_root_, session);
    const fs::path primary_frames = layout::frames_dir(primary_dir);

    if (!frames_r->empty()) {
      spdlog::info("[DualTierStore] transferring {} local frames to primary: {}", frames_r->size(),
                   session);
      const Status mk = run_with_deadline([primary_frames]() { return create_dirs(primary_frames); },
                                          copy_timeout_, "create " + session);
      if (!mk.ok()) {
        mark_primary_down(mk.message());
        return stop(mk.message());
      }
    }

    int moved = 0;
    for (const fs::path& frame : *frames_r) {
      const Status st = write_primary(primary_frames / frame.filename(), frame);
      if (!st.ok()) {
        mark_primary_down(st.message());
        return stop("transfer stalled at " + frame.filename().string() + " of " + session + ": " +
                    st.message());
      }
      fs::remove(frame, ec);
      if (ec) return stop("cannot delete local " + frame.string() + ": " + ec.message());
      ++moved;
      ++report.frames_transferred;
    }

    if (has_ready) {
      const Status st = close_on_primary(primary_dir);
      if (!st.ok()) {
        // Keep the local session (with its marker) for the next pass.
        mark_primary_down(st.message());
        return stop("could not create ready marker on primary for " + session + ": " + st.message());
      }
      ++report.markers_recreated;
    }

    fs::remove_all(local_dir, ec);
    if (ec) spdlog::warn("[DualTierStore] cannot remove {}: {}", local_dir.string(), ec.message());
    ++report.sessions_completed;
    spdlog::info("[DualTierStore] transferred {} frames for {}{}", moved, session,
                 has_ready ? " (ready marker recreated)" : "");
  }

  if (report.frames_transferred > 0) {
    spdlog::info("[DualTierStore] local frame transfer complete: {} frames moved to primary",
                 report.frames_transferred);
  }
  return report;
}

}  // namespace pl
