// File: src/core/storage/session_markers.cpp
#include "pl/core/storage/session_markers.hpp"

#include <system_error>

#include "pl/core/util/fs_util.hpp"

namespace pl {
namespace fs = std::filesystem;

namespace {

Status remove_if_present(const fs::path& p) {
  std::error_code ec;
  fs::remove(p, ec);
  if (ec) return Status::io_error("failed removing " + p.string() + ": " + ec.message());
  return Status::ok_status();
}

// rename(2) with "source missing" reported as false rather than an error.
Result<bool> rename_marker(const fs::path& from, const fs::path& to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec) return Result<bool>::ok(true);
  if (ec == std::errc::no_such_file_or_directory) return Result<bool>::ok(false);
  return Result<bool>::err(
      Status::io_error("rename " + from.string() + " -> " + to.string() + " failed: " + ec.message()));
}

// Drops the session video (and any partial copy) plus the terminal markers, then writes Ready.
Status requeue_terminal(const fs::path& session_dir) {
  const std::string prefix = session_dir.filename().string() + ".";
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(session_dir, ec)) {
    if (!entry.is_regular_file(ec)) continue;
    if (entry.path().filename().string().rfind(prefix, 0) != 0) continue;
    PL_RETURN_IF_ERROR(remove_if_present(entry.path()));
  }
  if (ec) return Status::io_error("failed listing " + session_dir.string() + ": " + ec.message());

  PL_RETURN_IF_ERROR(remove_if_present(marker_path(session_dir, Marker::kEncodingComplete)));
  PL_RETURN_IF_ERROR(remove_if_present(marker_path(session_dir, Marker::kEncodingFailed)));
  return touch_file(marker_path(session_dir, Marker::kReadyForEncoding));
}

}  // namespace

const char* marker_filename(Marker m) {
  switch (m) {
    case Marker::kReadyForEncoding: return "ready-for-encoding";
    case Marker::kEncodingInProgress: return "encoding-in-progress";
    case Marker::kEncodingComplete: return "encoding-complete";
    case Marker::kEncodingFailed: return "encoding-failed";
  }
  return "unknown-marker";
}

fs::path marker_path(const fs::path& session_dir, Marker m) {
  return session_dir / marker_filename(m);
}

bool has_marker(const fs::path& session_dir, Marker m) {
  std::error_code ec;
  return fs::exists(marker_path(session_dir, m), ec);
}

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::kEmpty: return "empty";
    case SessionState::kCapturing: return "capturing";
    case SessionState::kReady: return "ready";
    case SessionState::kEncoding: return "encoding";
    case SessionState::kComplete: return "complete";
    case SessionState::kFailed: return "failed";
  }
  return "unknown";
}

Result<SessionSnapshot> inspect_session(const fs::path& session_dir, const std::string& frame_ext,
                                        const std::string& video_ext) {
  SessionSnapshot snap;
  snap.dir = session_dir;
  snap.name = session_dir.filename().string();

  auto frames_r = list_frames(layout::frames_dir(session_dir), frame_ext);
  if (!frames_r.ok()) return Result<SessionSnapshot>::err(frames_r.status());
  snap.frame_count = static_cast<int>(frames_r->size());

  snap.has_ready = has_marker(session_dir, Marker::kReadyForEncoding);
  snap.has_in_progress = has_marker(session_dir, Marker::kEncodingInProgress);
  snap.has_complete = has_marker(session_dir, Marker::kEncodingComplete);
  snap.has_failed = has_marker(session_dir, Marker::kEncodingFailed);

  std::error_code ec;
  snap.has_video = fs::exists(layout::video_path(session_dir, video_ext), ec);

  if (snap.has_complete) snap.state = SessionState::kComplete;
  else if (snap.has_failed) snap.state = SessionState::kFailed;
  else if (snap.has_in_progress) snap.state = SessionState::kEncoding;
  else if (snap.has_ready) snap.state = SessionState::kReady;
  else if (snap.frame_count > 0) snap.state = SessionState::kCapturing;
  else snap.state = SessionState::kEmpty;

  return Result<SessionSnapshot>::ok(std::move(snap));
}

Status mark_ready(const fs::path& session_dir) {
  if (has_marker(session_dir, Marker::kEncodingComplete) ||
      has_marker(session_dir, Marker::kEncodingFailed) ||
      has_marker(session_dir, Marker::kEncodingInProgress)) {
    return Status::ok_status();
  }
  return touch_file(marker_path(session_dir, Marker::kReadyForEncoding));
}

Result<bool> claim(const fs::path& session_dir) {
  const fs::path in_progress = marker_path(session_dir, Marker::kEncodingInProgress);

  auto renamed = rename_marker(marker_path(session_dir, Marker::kReadyForEncoding), in_progress);
  if (!renamed.ok() || !*renamed) return renamed;

  // rename keeps the ready marker's mtime; staleness must count from now.
  const Status st = touch_file(in_progress);
  if (!st.ok()) return Result<bool>::err(st);
  return Result<bool>::ok(true);
}

Status mark_complete(const fs::path& session_dir) {
  PL_RETURN_IF_ERROR(touch_file(marker_path(session_dir, Marker::kEncodingComplete)));
  PL_RETURN_IF_ERROR(remove_if_present(marker_path(session_dir, Marker::kEncodingInProgress)));
  return remove_if_present(marker_path(session_dir, Marker::kReadyForEncoding));
}

Status mark_failed(const fs::path& session_dir) {
  PL_RETURN_IF_ERROR(touch_file(marker_path(session_dir, Marker::kEncodingFailed)));
  PL_RETURN_IF_ERROR(remove_if_present(marker_path(session_dir, Marker::kEncodingInProgress)));
  return remove_if_present(marker_path(session_dir, Marker::kReadyForEncoding));
}

Result<bool> reset_to_ready(const fs::path& session_dir) {
  return rename_marker(marker_path(session_dir, Marker::kEncodingInProgress),
                       marker_path(session_dir, Marker::kReadyForEncoding));
}

Result<bool> frames_newer_than(const fs::path& session_dir, const fs::path& reference,
                               const std::string& frame_ext) {
  std::error_code ec;
  const auto ref_time = fs::last_write_time(reference, ec);
  if (ec == std::errc::no_such_file_or_directory) return Result<bool>::ok(false);
  if (ec) {
    return Result<bool>::err(Status::io_error("cannot stat " + reference.string() + ": " + ec.message()));
  }

  auto frames = list_frames(layout::frames_dir(session_dir), frame_ext);
  if (!frames.ok()) return Result<bool>::err(frames.status());
  for (const fs::path& frame : *frames) {
    const auto t = fs::last_write_time(frame, ec);
    if (!ec && t > ref_time) return Result<bool>::ok(true);
  }
  return Result<bool>::ok(false);
}

Result<bool> close_capture(const fs::path& session_dir, const std::string& frame_ext) {
  const Status cleared = remove_if_present(layout::capture_heartbeat(session_dir));
  if (!cleared.ok()) return Result<bool>::err(cleared);

  Marker terminal = Marker::kEncodingComplete;
  if (!has_marker(session_dir, terminal)) terminal = Marker::kEncodingFailed;
  if (!has_marker(session_dir, terminal)) {
    const Status st = mark_ready(session_dir);
    if (!st.ok()) return Result<bool>::err(st);
    return Result<bool>::ok(false);
  }

  auto newer = frames_newer_than(session_dir, marker_path(session_dir, terminal), frame_ext);
  if (!newer.ok() || !*newer) return newer;

  const Status st = requeue_terminal(session_dir);
  if (!st.ok()) return Result<bool>::err(st);
  return Result<bool>::ok(true);
}

}  // namespace pl
