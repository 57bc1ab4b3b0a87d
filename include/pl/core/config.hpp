// include/pl/core/config.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pl/core/status.hpp"

namespace pl {

// Units policy:
// - Intervals and timeouts in whole seconds (int) unless the name says otherwise
// - Sizes in megabytes
// - Progress in percent (0..100)

// -----------------------------
// Printer status endpoint
// -----------------------------
struct PrinterConfig {
  // Host or host:port of the printer's local API.
  std::string host;
  std::string api_key;
  std::string status_path = "/api/v1/status";

  int poll_interval_s = 30;
  int request_timeout_s = 15;
};

// -----------------------------
// Still capture command
// -----------------------------
struct CameraConfig {
  std::string command = "rpicam-still";
  int width = 1704;
  int height = 1278;
  int quality = 85;
  std::string snapshot_path = "/tmp/printlapse_snapshot.jpg";
  int timeout_s = 30;
};

// -----------------------------
// Primary / fallback storage
// -----------------------------
struct StorageConfig {
  // Primary (network) root. Usually the mount point itself.
  std::string primary_root = "/mnt/nas/printer-footage";
  // Local emergency mirror.
  std::string fallback_root = "~/timelapse_local";

  std::string frame_ext = "jpg";
  int copy_timeout_s = 30;

  // Local frames are dropped below this free-space margin.
  std::int64_t min_free_mb = 2048;
};

// -----------------------------
// Mount health + recovery
// -----------------------------
struct MountConfig {
  std::string mount_point = "/mnt/nas/printer-footage";

  int probe_timeout_s = 5;
  int check_interval_s = 300;

  // Argument vectors, mount point appended. Empty `sudo` disables the prefix.
  std::string sudo = "sudo";
  std::vector<std::string> detach_command = {"umount", "-l"};
  std::vector<std::string> mount_command = {"mount"};
  int detach_timeout_s = 10;
  int mount_timeout_s = 30;
  int settle_s = 2;
};

// -----------------------------
// Session state machine
// -----------------------------
struct TimelapseConfig {
  int capture_interval_s = 30;

  // Finishing mode: faster capture once progress >= threshold.
  int finishing_threshold_pct = 98;
  int finishing_interval_s = 5;

  // Post-print extension.
  int post_print_frames = 24;
  int post_print_interval_s = 5;
  int post_print_max_failures = 10;

  // Consecutive not-active polls before a session leaves "keep open".
  int stop_debounce = 3;

  // Manual start/stop signal.
  std::string control_file = "~/.timelapse_recording";

  // Cooldown after an unexpected error inside a tick.
  int error_cooldown_s = 60;
};

// -----------------------------
// Video encoding
// -----------------------------
struct VideoConfig {
  bool enabled = true;

  std::string encoder_command = "ffmpeg";
  int frame_rate = 15;
  int rotation_deg = 180;
  int crf = 18;
  std::string preset = "veryfast";
  int threads = 2;
  std::string video_ext = "mp4";

  // Local scratch for the CPU-bound pass (kept off the network share).
  std::string scratch_dir = "/tmp/printlapse_encode";

  int timeout_s = 3600;
};

// -----------------------------
// Encoder loop
// -----------------------------
struct EncoderConfig {
  int check_interval_s = 60;

  // encoding-in-progress older than this is reset to ready on startup.
  double stale_age_hours = 2.0;

  // Frames-without-markers sessions idle this long are treated as abandoned.
  double abandoned_age_hours = 2.0;

  int health_probe_timeout_s = 5;
};

// -----------------------------
// Live-view snapshot upload
// -----------------------------
struct UploadConfig {
  bool enabled = false;
  std::string url = "https://webcam.connect.prusa3d.com/c/snapshot";
  std::string token;
  std::string fingerprint = "printlapse-camera";
  int interval_s = 12;
  int request_timeout_s = 30;
  int max_failures = 5;
  int backoff_s = 60;
};

// -----------------------------
// Output (events) + logging
// -----------------------------
struct OutputConfig {
  std::string events_dir = "~/.printlapse/events";

  // Emit a heartbeat event every N seconds (0 disables).
  int heartbeat_period_s = 300;

  // Older event files beyond this count are pruned at start.
  int keep_runs = 50;
};

struct LoggingConfig {
  std::string level = "info";  // trace | debug | info | warn | error
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  PrinterConfig printer;
  CameraConfig camera;
  StorageConfig storage;
  MountConfig mount;
  TimelapseConfig timelapse;
  VideoConfig video;
  EncoderConfig encoder;
  UploadConfig upload;
  OutputConfig output;
  LoggingConfig logging;
};

inline bool is_known_preset(const std::string& p) {
  static const char* const kPresets[] = {"ultrafast", "superfast", "veryfast", "faster", "fast",
                                         "medium",    "slow",      "slower",   "veryslow"};
  for (const char* k : kPresets) {
    if (p == k) return true;
  }
  return false;
}

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.printer.poll_interval_s < 1) {
    return Status::invalid_argument("printer.poll_interval_s must be >= 1");
  }
  if (cfg.printer.request_timeout_s < 1) {
    return Status::invalid_argument("printer.request_timeout_s must be >= 1");
  }
  if (cfg.camera.command.empty()) {
    return Status::invalid_argument("camera.command must not be empty");
  }
  if (cfg.camera.width <= 0 || cfg.camera.height <= 0) {
    return Status::invalid_argument("camera.width/height must be > 0");
  }
  if (cfg.camera.quality < 1 || cfg.camera.quality > 100) {
    return Status::invalid_argument("camera.quality must be in [1, 100]");
  }
  if (cfg.camera.timeout_s < 1) {
    return Status::invalid_argument("camera.timeout_s must be >= 1");
  }
  if (cfg.storage.primary_root.empty() || cfg.storage.fallback_root.empty()) {
    return Status::invalid_argument("storage.primary_root and storage.fallback_root must not be empty");
  }
  if (cfg.storage.primary_root == cfg.storage.fallback_root) {
    return Status::invalid_argument("storage.fallback_root must differ from storage.primary_root");
  }
  if (cfg.storage.frame_ext.empty()) {
    return Status::invalid_argument("storage.frame_ext must not be empty");
  }
  if (cfg.storage.copy_timeout_s < 1) {
    return Status::invalid_argument("storage.copy_timeout_s must be >= 1");
  }
  if (cfg.storage.min_free_mb < 0) {
    return Status::invalid_argument("storage.min_free_mb must be >= 0");
  }
  if (cfg.mount.mount_point.empty()) {
    return Status::invalid_argument("mount.mount_point must not be empty");
  }
  if (cfg.mount.probe_timeout_s < 1 || cfg.mount.check_interval_s < 1) {
    return Status::invalid_argument("mount.probe_timeout_s and mount.check_interval_s must be >= 1");
  }
  if (cfg.mount.detach_command.empty() || cfg.mount.mount_command.empty()) {
    return Status::invalid_argument("mount.detach_command and mount.mount_command must not be empty");
  }
  if (cfg.mount.settle_s < 0) {
    return Status::invalid_argument("mount.settle_s must be >= 0");
  }
  if (cfg.timelapse.capture_interval_s < 1) {
    return Status::invalid_argument("timelapse.capture_interval_s must be >= 1");
  }
  if (cfg.timelapse.finishing_threshold_pct < 0 || cfg.timelapse.finishing_threshold_pct > 100) {
    return Status::invalid_argument("timelapse.finishing_threshold_pct must be in [0, 100]");
  }
  if (cfg.timelapse.finishing_interval_s < 1) {
    return Status::invalid_argument("timelapse.finishing_interval_s must be >= 1");
  }
  if (cfg.timelapse.post_print_frames < 0) {
    return Status::invalid_argument("timelapse.post_print_frames must be >= 0");
  }
  if (cfg.timelapse.post_print_interval_s < 1) {
    return Status::invalid_argument("timelapse.post_print_interval_s must be >= 1");
  }
  if (cfg.timelapse.post_print_max_failures < 1) {
    return Status::invalid_argument("timelapse.post_print_max_failures must be >= 1");
  }
  if (cfg.timelapse.stop_debounce < 1) {
    return Status::invalid_argument("timelapse.stop_debounce must be >= 1");
  }
  if (cfg.timelapse.control_file.empty()) {
    return Status::invalid_argument("timelapse.control_file must not be empty");
  }
  if (cfg.timelapse.error_cooldown_s < 0) {
    return Status::invalid_argument("timelapse.error_cooldown_s must be >= 0");
  }
  if (cfg.video.encoder_command.empty()) {
    return Status::invalid_argument("video.encoder_command must not be empty");
  }
  if (cfg.video.frame_rate < 1 || cfg.video.frame_rate > 60) {
    return Status::invalid_argument("video.frame_rate must be in [1, 60]");
  }
  if (cfg.video.rotation_deg != 0 && cfg.video.rotation_deg != 90 &&
      cfg.video.rotation_deg != 180 && cfg.video.rotation_deg != 270) {
    return Status::invalid_argument("video.rotation_deg must be one of 0, 90, 180, 270");
  }
  if (cfg.video.crf < 0 || cfg.video.crf > 51) {
    return Status::invalid_argument("video.crf must be in [0, 51]");
  }
  if (!is_known_preset(cfg.video.preset)) {
    return Status::invalid_argument("video.preset is not a known x264 preset: " + cfg.video.preset);
  }
  if (cfg.video.threads < 1) {
    return Status::invalid_argument("video.threads must be >= 1");
  }
  if (cfg.video.video_ext.empty() || cfg.video.scratch_dir.empty()) {
    return Status::invalid_argument("video.video_ext and video.scratch_dir must not be empty");
  }
  if (cfg.video.timeout_s < 1) {
    return Status::invalid_argument("video.timeout_s must be >= 1");
  }
  if (cfg.encoder.check_interval_s < 1) {
    return Status::invalid_argument("encoder.check_interval_s must be >= 1");
  }
  if (cfg.encoder.stale_age_hours < 0.0 || cfg.encoder.abandoned_age_hours < 0.0) {
    return Status::invalid_argument("encoder.stale_age_hours and encoder.abandoned_age_hours must be >= 0");
  }
  if (cfg.encoder.health_probe_timeout_s < 1) {
    return Status::invalid_argument("encoder.health_probe_timeout_s must be >= 1");
  }
  if (cfg.upload.enabled && (cfg.upload.token.empty() || cfg.upload.url.empty())) {
    return Status::invalid_argument("upload.token and upload.url are required when upload.enabled");
  }
  if (cfg.upload.interval_s < 1 || cfg.upload.max_failures < 1 || cfg.upload.backoff_s < 0) {
    return Status::invalid_argument("upload.interval_s/max_failures must be >= 1, backoff_s >= 0");
  }
  if (cfg.output.events_dir.empty()) {
    return Status::invalid_argument("output.events_dir must not be empty");
  }
  if (cfg.output.heartbeat_period_s < 0) {
    return Status::invalid_argument("output.heartbeat_period_s must be >= 0");
  }
  if (cfg.output.keep_runs < 1) {
    return Status::invalid_argument("output.keep_runs must be >= 1");
  }
  return Status::ok_status();
}

}  // namespace pl
