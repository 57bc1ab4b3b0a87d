// File: include/pl/core/encoding/video_encoder.hpp
#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "pl/core/config.hpp"
#include "pl/core/status.hpp"
#include "pl/core/types.hpp"
#include "pl/core/util/subprocess.hpp"

namespace pl {

enum class EncodeOutcome {
  kSuccess,
  kFailed,    // non-zero exit, or the encoder wrote no output
  kKilled,    // SIGKILL from outside (usually the OOM killer)
  kTimedOut,  // wall-clock limit reached, child killed
  kRequeued,  // video not kept (could not be stored, or frames arrived meanwhile); no terminal marker
};

const char* to_string(EncodeOutcome o);

// One in-flight encode. Move-only (owns the child process).
struct EncodeJob {
  SessionName session;
  std::filesystem::path session_dir;  // on primary
  std::filesystem::path scratch_dir;  // <video.scratch_dir>/<session>
  std::filesystem::path output_path;  // scratch copy of the video
  std::filesystem::path final_path;   // <session_dir>/<session>.<ext>
  std::filesystem::path process_log;  // encoder stdout/stderr
  int frame_count = 0;

  std::vector<std::string> argv;
  ChildProcess child;
};

// Turns a session's frames into a video with an external encoder.
//
// Frames are linked into a local scratch directory as a gap-free 000000.. sequence and
// the encoder writes its output there too, so the network share only sees reads and one
// final move.
class VideoEncoder {
 public:
  VideoEncoder(VideoConfig cfg, std::string frame_ext, std::chrono::seconds io_timeout);

  // Errors: not_found when the session has no frames, io_error on scratch setup.
  Result<EncodeJob> prepare(const std::filesystem::path& session_dir) const;

  Status start(EncodeJob& job) const;

  // Non-blocking. Kills the child once the wall-clock limit is exceeded.
  std::optional<ProcessResult> poll(EncodeJob& job) const;

  // Relocate on success and write the terminal marker; always clears scratch.
  // A session that cannot keep its video goes back to ready (or to capturing while the
  // capture daemon still holds it) instead of becoming terminal.
  EncodeOutcome finish(EncodeJob& job, const ProcessResult& exit) const;

  // prepare + start + wait + finish. The caller owns the claim.
  EncodeOutcome encode(const std::filesystem::path& session_dir) const;

  std::vector<std::string> build_argv(const std::filesystem::path& input_pattern,
                                      const std::filesystem::path& output) const;

  // complete / failed marker, bounded by the store I/O timeout.
  Status mark_terminal(const std::filesystem::path& session_dir, bool complete) const;

  // "" for 0; transpose chain otherwise.
  static std::string rotation_filter(int degrees);

  std::chrono::seconds timeout() const { return std::chrono::seconds(cfg_.timeout_s); }
  const VideoConfig& config() const { return cfg_; }

 private:
  Status relocate(const EncodeJob& job) const;
  Status requeue(const EncodeJob& job) const;
  void clear_scratch(const EncodeJob& job) const;

  VideoConfig cfg_;
  std::string frame_ext_;
  std::chrono::seconds io_timeout_;
};

}  // namespace pl
