// File: include/pl/core/storage/session_markers.hpp
#pragma once

#include <filesystem>
#include <string>

#include "pl/core/status.hpp"
#include "pl/core/types.hpp"

namespace pl {

// Store layout (primary and fallback mirror the same shape):
//   <root>/<session>/frames/frame_NNNNNN.<ext>
//   <root>/<session>/<marker>
//   <root>/<session>/<session>.<video-ext>
//   <root>/<session>/encoding.log
//   <root>/<session>/capture-active     touched by the capture daemon while the session is open
namespace layout {

inline constexpr const char* kFramesDir = "frames";
inline constexpr const char* kEncodingLog = "encoding.log";
inline constexpr const char* kCaptureHeartbeat = "capture-active";

inline std::filesystem::path session_dir(const std::filesystem::path& root, const SessionName& s) {
  return root / s;
}
inline std::filesystem::path frames_dir(const std::filesystem::path& session_dir) {
  return session_dir / kFramesDir;
}
inline std::filesystem::path capture_heartbeat(const std::filesystem::path& session_dir) {
  return session_dir / kCaptureHeartbeat;
}
inline std::filesystem::path video_path(const std::filesystem::path& session_dir,
                                        const std::string& video_ext) {
  return session_dir / (session_dir.filename().string() + "." + video_ext);
}

}  // namespace layout

enum class Marker {
  kReadyForEncoding,
  kEncodingInProgress,
  kEncodingComplete,
  kEncodingFailed,
};

const char* marker_filename(Marker m);
std::filesystem::path marker_path(const std::filesystem::path& session_dir, Marker m);
bool has_marker(const std::filesystem::path& session_dir, Marker m);

// State derived purely from directory contents.
//   terminal markers win; then in-progress; then ready; then frames present / empty.
enum class SessionState {
  kEmpty,      // no frames, no markers
  kCapturing,  // frames, no markers (live or abandoned)
  kReady,
  kEncoding,
  kComplete,
  kFailed,
};

const char* to_string(SessionState s);

struct SessionSnapshot {
  std::filesystem::path dir;
  SessionName name;
  int frame_count = 0;

  bool has_ready = false;
  bool has_in_progress = false;
  bool has_complete = false;
  bool has_failed = false;
  bool has_video = false;

  SessionState state = SessionState::kEmpty;
};

Result<SessionSnapshot> inspect_session(const std::filesystem::path& session_dir,
                                        const std::string& frame_ext,
                                        const std::string& video_ext);

// --- Transitions. Each is safe to repeat after a crash.

// Capturing -> Ready. No-op when the session is already Ready/Encoding or terminal.
Status mark_ready(const std::filesystem::path& session_dir);

// Ready -> Encoding by atomic rename, then refreshes the marker mtime so staleness is
// measured from the claim. Returns false when the ready marker is gone (claimed
// elsewhere or never there).
Result<bool> claim(const std::filesystem::path& session_dir);

// Encoding -> Complete / Failed. Leaves no ready or in-progress marker behind.
Status mark_complete(const std::filesystem::path& session_dir);
Status mark_failed(const std::filesystem::path& session_dir);

// Encoding -> Ready by atomic rename. Returns false when no in-progress marker exists.
Result<bool> reset_to_ready(const std::filesystem::path& session_dir);

// True when some frame was written after `reference` (a marker or the heartbeat).
// False when `reference` does not exist.
Result<bool> frames_newer_than(const std::filesystem::path& session_dir,
                               const std::filesystem::path& reference,
                               const std::string& frame_ext);

// Capture side of the handoff, run when the capture daemon closes a session:
//  - clears the capture heartbeat;
//  - Capturing -> Ready;
//  - a terminal session that gained frames after its terminal marker (it was recovered
//    as abandoned while still live) is re-queued: old video and terminal markers are
//    removed and Ready is written. Returns true in that case.
// An in-progress session is left to the encoder, which notices the extra frames itself.
Result<bool> close_capture(const std::filesystem::path& session_dir, const std::string& frame_ext);

}  // namespace pl
