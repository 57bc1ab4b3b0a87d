// File: src/core/util/repro_hash.cpp
#include "pl/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>
#include <vector>

namespace pl {
namespace {

// FNV-1a 64-bit. Not cryptographic. Exactly what we want for fast, stable fingerprints.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) {
    const std::uint64_t bits = std::bit_cast<std::uint64_t>(v);
    add_u64(bits);
  }

  void add_argv(const std::vector<std::string>& argv) {
    add_u64(static_cast<std::uint64_t>(argv.size()));
    for (const auto& a : argv) add_string(a);
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  // Printer (api key deliberately left out).
  h.add_string(cfg.printer.host);
  h.add_string(cfg.printer.status_path);
  h.add_i32(cfg.printer.poll_interval_s);
  h.add_i32(cfg.printer.request_timeout_s);

  // Camera.
  h.add_string(cfg.camera.command);
  h.add_i32(cfg.camera.width);
  h.add_i32(cfg.camera.height);
  h.add_i32(cfg.camera.quality);
  h.add_string(cfg.camera.snapshot_path);
  h.add_i32(cfg.camera.timeout_s);

  // Storage.
  h.add_string(cfg.storage.primary_root);
  h.add_string(cfg.storage.fallback_root);
  h.add_string(cfg.storage.frame_ext);
  h.add_i32(cfg.storage.copy_timeout_s);
  h.add_i64(cfg.storage.min_free_mb);

  // Mount.
  h.add_string(cfg.mount.mount_point);
  h.add_i32(cfg.mount.probe_timeout_s);
  h.add_i32(cfg.mount.check_interval_s);
  h.add_string(cfg.mount.sudo);
  h.add_argv(cfg.mount.detach_command);
  h.add_argv(cfg.mount.mount_command);
  h.add_i32(cfg.mount.detach_timeout_s);
  h.add_i32(cfg.mount.mount_timeout_s);
  h.add_i32(cfg.mount.settle_s);

  // Timelapse.
  h.add_i32(cfg.timelapse.capture_interval_s);
  h.add_i32(cfg.timelapse.finishing_threshold_pct);
  h.add_i32(cfg.timelapse.finishing_interval_s);
  h.add_i32(cfg.timelapse.post_print_frames);
  h.add_i32(cfg.timelapse.post_print_interval_s);
  h.add_i32(cfg.timelapse.post_print_max_failures);
  h.add_i32(cfg.timelapse.stop_debounce);
  h.add_string(cfg.timelapse.control_file);
  h.add_i32(cfg.timelapse.error_cooldown_s);

  // Video.
  h.add_bool(cfg.video.enabled);
  h.add_string(cfg.video.encoder_command);
  h.add_i32(cfg.video.frame_rate);
  h.add_i32(cfg.video.rotation_deg);
  h.add_i32(cfg.video.crf);
  h.add_string(cfg.video.preset);
  h.add_i32(cfg.video.threads);
  h.add_string(cfg.video.video_ext);
  h.add_string(cfg.video.scratch_dir);
  h.add_i32(cfg.video.timeout_s);

  // Encoder loop.
  h.add_i32(cfg.encoder.check_interval_s);
  h.add_double(cfg.encoder.stale_age_hours);
  h.add_double(cfg.encoder.abandoned_age_hours);
  h.add_i32(cfg.encoder.health_probe_timeout_s);

  // Upload (token deliberately left out).
  h.add_bool(cfg.upload.enabled);
  h.add_string(cfg.upload.url);
  h.add_string(cfg.upload.fingerprint);
  h.add_i32(cfg.upload.interval_s);
  h.add_i32(cfg.upload.request_timeout_s);
  h.add_i32(cfg.upload.max_failures);
  h.add_i32(cfg.upload.backoff_s);

  // Output.
  h.add_string(cfg.output.events_dir);
  h.add_i32(cfg.output.heartbeat_period_s);
  h.add_i32(cfg.output.keep_runs);

  return to_hex(h.h);
}

}  // namespace pl
