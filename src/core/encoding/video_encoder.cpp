// File: src/core/encoding/video_encoder.cpp
#include "pl/core/encoding/video_encoder.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "pl/core/encoding/session_log.hpp"
#include "pl/core/storage/session_markers.hpp"
#include "pl/core/util/deadline.hpp"
#include "pl/core/util/fs_util.hpp"

namespace pl {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kOutputExcerpt = 1000;
constexpr const char* kProcessLogName = "encoder_output.log";

std::string sequence_name(int index, const std::string& ext) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%06d", index);
  return std::string(buf) + "." + ext;
}

std::string read_head(const fs::path& p, std::size_t max_bytes) {
  std::ifstream f(p, std::ios::in | std::ios::binary);
  if (!f.is_open()) return {};
  std::string out(max_bytes, '\0');
  f.read(out.data(), static_cast<std::streamsize>(max_bytes));
  out.resize(static_cast<std::size_t>(f.gcount()));
  return out;
}

}  // namespace

const char* to_string(EncodeOutcome o) {
  switch (o) {
    case EncodeOutcome::kSuccess: return "success";
    case EncodeOutcome::kFailed: return "failed";
    case EncodeOutcome::kKilled: return "killed";
    case EncodeOutcome::kTimedOut: return "timed_out";
    case EncodeOutcome::kRequeued: return "requeued";
  }
  return "unknown";
}

VideoEncoder::VideoEncoder(VideoConfig cfg, std::string frame_ext, std::chrono::seconds io_timeout)
    : cfg_(std::move(cfg)), frame_ext_(std::move(frame_ext)), io_timeout_(io_timeout) {}

std::string VideoEncoder::rotation_filter(int degrees) {
  switch (degrees) {
    case 90: return "transpose=1";
    case 180: return "transpose=1,transpose=1";
    case 270: return "transpose=2";
    default: return "";
  }
}

std::vector<std::string> VideoEncoder::build_argv(const fs::path& input_pattern,
                                                  const fs::path& output) const {
  std::vector<std::string> argv = {
      cfg_.encoder_command, "-y", "-framerate", std::to_string(cfg_.frame_rate),
      "-i", input_pattern.string(),
  };

  const std::string vf = rotation_filter(cfg_.rotation_deg);
  if (!vf.empty()) {
    argv.push_back("-vf");
    argv.push_back(vf);
  }

  const std::vector<std::string> tail = {
      "-c:v",     "libx264",
      "-crf",     std::to_string(cfg_.crf),
      "-preset",  cfg_.preset,
      "-pix_fmt", "yuv420p",
      "-threads", std::to_string(cfg_.threads),
      "-movflags", "+faststart",
      output.string(),
  };
  argv.insert(argv.end(), tail.begin(), tail.end());
  return argv;
}

Result<EncodeJob> VideoEncoder::prepare(const fs::path& session_dir) const {
  EncodeJob job;
  job.session = session_dir.filename().string();
  job.session_dir = session_dir;
  job.scratch_dir = fs::path(cfg_.scratch_dir) / job.session;
  job.output_path = job.scratch_dir / (job.session + "." + cfg_.video_ext);
  job.final_path = layout::video_path(session_dir, cfg_.video_ext);
  job.process_log = job.scratch_dir / kProcessLogName;

  auto frames_r = list_frames(layout::frames_dir(session_dir), frame_ext_);
  if (!frames_r.ok()) return Result<EncodeJob>::err(frames_r.status());
  if (frames_r->empty()) {
    return Result<EncodeJob>::err(Status::not_found("no frames in " + session_dir.string()));
  }

  std::error_code ec;
  fs::remove_all(job.scratch_dir, ec);
  fs::create_directories(job.scratch_dir, ec);
  if (ec) {
    return Result<EncodeJob>::err(
        Status::io_error("cannot create scratch " + job.scratch_dir.string() + ": " + ec.message()));
  }

  // Renumber from zero so gaps left by dropped frames do not end the sequence early.
  int index = 0;
  for (const fs::path& frame : *frames_r) {
    const fs::path target = fs::absolute(frame, ec);
    if (!ec) fs::create_symlink(target, job.scratch_dir / sequence_name(index, frame_ext_), ec);
    if (ec) {
      return Result<EncodeJob>::err(
          Status::io_error("cannot link " + frame.string() + " into scratch: " + ec.message()));
    }
    ++index;
  }
  job.frame_count = index;

  job.argv = build_argv(job.scratch_dir / ("%06d." + frame_ext_), job.output_path);
  return Result<EncodeJob>::ok(std::move(job));
}

Status VideoEncoder::start(EncodeJob& job) const {
  const SessionLog log(job.session_dir);
  log.memory_snapshot();
  log.info("Starting video processing: " + std::to_string(job.frame_count) + " frames");
  log.info("Running: " + join_argv(job.argv));

  ProcessOptions opts;
  opts.output_file = job.process_log.string();
  auto child_r = ChildProcess::spawn(job.argv, opts);
  if (!child_r.ok()) {
    log.error("could not start encoder: " + child_r.status().message());
    return child_r.status();
  }
  job.child = child_r.take_value();
  return Status::ok_status();
}

std::optional<ProcessResult> VideoEncoder::poll(EncodeJob& job) const {
  if (!job.child.running()) return std::nullopt;
  if (auto done = job.child.poll()) return done;
  if (job.child.elapsed() >= timeout()) return job.child.kill(/*timed_out=*/true);
  return std::nullopt;
}

Status VideoEncoder::relocate(const EncodeJob& job) const {
  std::error_code ec;
  if (!fs::exists(job.output_path, ec)) {
    return Status::not_found("encoder produced no output at " + job.output_path.string());
  }

  fs::rename(job.output_path, job.final_path, ec);
  if (!ec) return Status::ok_status();
  if (ec != std::errc::cross_device_link) {
    return Status::io_error("move to " + job.final_path.string() + " failed: " + ec.message());
  }

  const fs::path src = job.output_path;
  const fs::path dst = job.final_path;
  PL_RETURN_IF_ERROR(run_with_deadline([src, dst]() { return copy_file_atomic(src, dst); },
                                       timeout(), "video copy to primary"));
  fs::remove(src, ec);
  return Status::ok_status();
}

void VideoEncoder::clear_scratch(const EncodeJob& job) const {
  std::error_code ec;
  fs::remove_all(job.scratch_dir, ec);
  if (ec) spdlog::warn("[VideoEncoder] could not clear {}: {}", job.scratch_dir.string(), ec.message());
}

Status VideoEncoder::requeue(const EncodeJob& job) const {
  const fs::path dir = job.session_dir;
  const fs::path video = job.final_path;
  return run_with_deadline(
      [dir, video]() -> Status {
        for (const fs::path& p : {video, fs::path(video.string() + ".part")}) {
          std::error_code ec;
          if (!fs::is_regular_file(p, ec)) continue;
          fs::remove(p, ec);
          if (ec) return Status::io_error("cannot remove " + p.string() + ": " + ec.message());
        }

        // Capture still open: leave the session to it, it writes the ready marker on close.
        if (fs::exists(layout::capture_heartbeat(dir))) {
          std::error_code ec;
          fs::remove(marker_path(dir, Marker::kEncodingInProgress), ec);
          if (ec) return Status::io_error("cannot release claim on " + dir.string() + ": " + ec.message());
          if (fs::exists(layout::capture_heartbeat(dir))) return Status::ok_status();
          return mark_ready(dir);
        }

        auto reset = reset_to_ready(dir);
        if (!reset.ok()) return reset.status();
        if (!*reset) return mark_ready(dir);
        return Status::ok_status();
      },
      io_timeout_, "requeue of " + dir.filename().string());
}

Status VideoEncoder::mark_terminal(const fs::path& session_dir, bool complete) const {
  return run_with_deadline(
      [session_dir, complete]() { return complete ? mark_complete(session_dir) : mark_failed(session_dir); },
      io_timeout_, "terminal marker for " + session_dir.filename().string());
}

EncodeOutcome VideoEncoder::finish(EncodeJob& job, const ProcessResult& exit) const {
  const SessionLog log(job.session_dir);
  EncodeOutcome outcome = EncodeOutcome::kFailed;

  if (exit.timed_out) {
    log.error("encoder timeout (" + std::to_string(cfg_.timeout_s) + "s), killed");
    outcome = EncodeOutcome::kTimedOut;
  } else if (exit.killed_by_sigkill()) {
    log.error("encoder killed by signal 9 (likely out of memory)");
    outcome = EncodeOutcome::kKilled;
  } else if (!exit.success()) {
    log.error("encoder failed (" + exit.describe() + ")");
    const std::string head = read_head(job.process_log, kOutputExcerpt);
    if (!head.empty()) log.info("Encoder output: " + head);
  } else {
    const Status st = relocate(job);
    auto late = frames_newer_than(job.session_dir,
                                  marker_path(job.session_dir, Marker::kEncodingInProgress), frame_ext_);
    if (st.ok() && late.ok() && *late) {
      log.info("New frames arrived during encoding; discarding video and re-queuing");
      outcome = EncodeOutcome::kRequeued;
    } else if (st.ok()) {
      std::error_code ec;
      const auto bytes = fs::file_size(job.final_path, ec);
      char size_mb[32];
      std::snprintf(size_mb, sizeof(size_mb), "%.1f", ec ? 0.0 : static_cast<double>(bytes) / (1024.0 * 1024.0));
      log.info("SUCCESS: Video created: " + job.final_path.filename().string() + " (" + size_mb + " MB)");
      outcome = EncodeOutcome::kSuccess;
    } else if (st.code() == Status::Code::kNotFound) {
      log.error(st.message());
    } else {
      log.error("could not store video: " + st.message() + "; session re-queued");
      outcome = EncodeOutcome::kRequeued;
    }
  }

  if (outcome == EncodeOutcome::kRequeued) {
    const Status requeued = requeue(job);
    if (!requeued.ok()) {
      spdlog::error("[VideoEncoder] {}: could not re-queue: {}", job.session, requeued.message());
    }
  } else {
    const Status marked = mark_terminal(job.session_dir, outcome == EncodeOutcome::kSuccess);
    if (!marked.ok()) {
      spdlog::error("[VideoEncoder] {}: could not write terminal marker: {}", job.session, marked.message());
    }
  }

  clear_scratch(job);
  return outcome;
}

EncodeOutcome VideoEncoder::encode(const fs::path& session_dir) const {
  auto job_r = prepare(session_dir);
  if (!job_r.ok()) {
    SessionLog(session_dir).error(job_r.status().message());
    const Status marked = mark_terminal(session_dir, false);
    if (!marked.ok()) spdlog::error("[VideoEncoder] {}", marked.message());
    return EncodeOutcome::kFailed;
  }
  EncodeJob job = job_r.take_value();

  if (!start(job).ok()) {
    const Status marked = mark_terminal(session_dir, false);
    if (!marked.ok()) spdlog::error("[VideoEncoder] {}", marked.message());
    clear_scratch(job);
    return EncodeOutcome::kFailed;
  }

  const ProcessResult exit = job.child.wait_for(timeout());
  return finish(job, exit);
}

}  // namespace pl
