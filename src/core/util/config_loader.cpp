// src/core/util/config_loader.cpp
#include "pl/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "pl/core/util/fs_util.hpp"

namespace pl {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static void maybe_set_path(const YAML::Node& n, const char* key, std::string& out) {
  if (!n || !n[key]) return;
  out = n[key].as<std::string>();
}

static Result<std::vector<std::string>> parse_argv(const YAML::Node& n, const char* what) {
  if (!n.IsSequence()) {
    return Result<std::vector<std::string>>::err(
        Status::invalid_argument(std::string(what) + " must be a YAML sequence of strings"));
  }
  std::vector<std::string> out;
  for (std::size_t i = 0; i < n.size(); ++i) out.push_back(n[i].as<std::string>());
  return Result<std::vector<std::string>>::ok(std::move(out));
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 8) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static Status apply_yaml(const YAML::Node& y, Config& cfg) {
  // --- printer
  if (is_map(y["printer"])) {
    const auto p = y["printer"];
    maybe_set(p, "host", cfg.printer.host);
    maybe_set(p, "api_key", cfg.printer.api_key);
    maybe_set(p, "status_path", cfg.printer.status_path);
    maybe_set(p, "poll_interval_s", cfg.printer.poll_interval_s);
    maybe_set(p, "request_timeout_s", cfg.printer.request_timeout_s);
  }

  // --- camera
  if (is_map(y["camera"])) {
    const auto c = y["camera"];
    maybe_set(c, "command", cfg.camera.command);
    maybe_set(c, "width", cfg.camera.width);
    maybe_set(c, "height", cfg.camera.height);
    maybe_set(c, "quality", cfg.camera.quality);
    maybe_set_path(c, "snapshot_path", cfg.camera.snapshot_path);
    maybe_set(c, "timeout_s", cfg.camera.timeout_s);
  }

  // --- storage
  if (is_map(y["storage"])) {
    const auto s = y["storage"];
    maybe_set_path(s, "primary_root", cfg.storage.primary_root);
    maybe_set_path(s, "fallback_root", cfg.storage.fallback_root);
    maybe_set(s, "frame_ext", cfg.storage.frame_ext);
    maybe_set(s, "copy_timeout_s", cfg.storage.copy_timeout_s);
    maybe_set(s, "min_free_mb", cfg.storage.min_free_mb);
  }

  // --- mount
  if (is_map(y["mount"])) {
    const auto m = y["mount"];
    maybe_set_path(m, "mount_point", cfg.mount.mount_point);
    maybe_set(m, "probe_timeout_s", cfg.mount.probe_timeout_s);
    maybe_set(m, "check_interval_s", cfg.mount.check_interval_s);
    maybe_set(m, "sudo", cfg.mount.sudo);
    maybe_set(m, "detach_timeout_s", cfg.mount.detach_timeout_s);
    maybe_set(m, "mount_timeout_s", cfg.mount.mount_timeout_s);
    maybe_set(m, "settle_s", cfg.mount.settle_s);
    if (m["detach_command"]) {
      auto argv = parse_argv(m["detach_command"], "mount.detach_command");
      if (!argv.ok()) return argv.status();
      cfg.mount.detach_command = argv.take_value();
    }
    if (m["mount_command"]) {
      auto argv = parse_argv(m["mount_command"], "mount.mount_command");
      if (!argv.ok()) return argv.status();
      cfg.mount.mount_command = argv.take_value();
    }
  }

  // --- timelapse
  if (is_map(y["timelapse"])) {
    const auto t = y["timelapse"];
    maybe_set(t, "capture_interval_s", cfg.timelapse.capture_interval_s);
    maybe_set(t, "finishing_threshold_pct", cfg.timelapse.finishing_threshold_pct);
    maybe_set(t, "finishing_interval_s", cfg.timelapse.finishing_interval_s);
    maybe_set(t, "post_print_frames", cfg.timelapse.post_print_frames);
    maybe_set(t, "post_print_interval_s", cfg.timelapse.post_print_interval_s);
    maybe_set(t, "post_print_max_failures", cfg.timelapse.post_print_max_failures);
    maybe_set(t, "stop_debounce", cfg.timelapse.stop_debounce);
    maybe_set_path(t, "control_file", cfg.timelapse.control_file);
    maybe_set(t, "error_cooldown_s", cfg.timelapse.error_cooldown_s);
  }

  // --- video
  if (is_map(y["video"])) {
    const auto v = y["video"];
    maybe_set(v, "enabled", cfg.video.enabled);
    maybe_set(v, "encoder_command", cfg.video.encoder_command);
    maybe_set(v, "frame_rate", cfg.video.frame_rate);
    maybe_set(v, "rotation_deg", cfg.video.rotation_deg);
    maybe_set(v, "crf", cfg.video.crf);
    if (v["preset"]) cfg.video.preset = to_lower(v["preset"].as<std::string>());
    maybe_set(v, "threads", cfg.video.threads);
    maybe_set(v, "video_ext", cfg.video.video_ext);
    maybe_set_path(v, "scratch_dir", cfg.video.scratch_dir);
    maybe_set(v, "timeout_s", cfg.video.timeout_s);
  }

  // --- encoder loop
  if (is_map(y["encoder"])) {
    const auto e = y["encoder"];
    maybe_set(e, "check_interval_s", cfg.encoder.check_interval_s);
    maybe_set(e, "stale_age_hours", cfg.encoder.stale_age_hours);
    maybe_set(e, "abandoned_age_hours", cfg.encoder.abandoned_age_hours);
    maybe_set(e, "health_probe_timeout_s", cfg.encoder.health_probe_timeout_s);
  }

  // --- upload
  if (is_map(y["upload"])) {
    const auto u = y["upload"];
    maybe_set(u, "enabled", cfg.upload.enabled);
    maybe_set(u, "url", cfg.upload.url);
    maybe_set(u, "token", cfg.upload.token);
    maybe_set(u, "fingerprint", cfg.upload.fingerprint);
    maybe_set(u, "interval_s", cfg.upload.interval_s);
    maybe_set(u, "request_timeout_s", cfg.upload.request_timeout_s);
    maybe_set(u, "max_failures", cfg.upload.max_failures);
    maybe_set(u, "backoff_s", cfg.upload.backoff_s);
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set_path(o, "events_dir", cfg.output.events_dir);
    maybe_set(o, "heartbeat_period_s", cfg.output.heartbeat_period_s);
    maybe_set(o, "keep_runs", cfg.output.keep_runs);
  }

  // --- logging
  if (is_map(y["logging"])) {
    const auto l = y["logging"];
    if (l["level"]) cfg.logging.level = to_lower(l["level"].as<std::string>());
  }

  return Status::ok_status();
}

static void expand_paths(Config& cfg) {
  cfg.camera.snapshot_path = expand_home(cfg.camera.snapshot_path);
  cfg.storage.primary_root = expand_home(cfg.storage.primary_root);
  cfg.storage.fallback_root = expand_home(cfg.storage.fallback_root);
  cfg.mount.mount_point = expand_home(cfg.mount.mount_point);
  cfg.timelapse.control_file = expand_home(cfg.timelapse.control_file);
  cfg.video.scratch_dir = expand_home(cfg.video.scratch_dir);
  cfg.output.events_dir = expand_home(cfg.output.events_dir);
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path, 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  const YAML::Node y = yaml_r.take_value();

  Config cfg;  // defaults

  // yaml-cpp throws on type mismatches (e.g. "abc" for an int).
  try {
    const Status s = apply_yaml(y, cfg);
    if (!s.ok()) return Result<Config>::err(s);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("bad value in " + path.string() + ": " + e.what()));
  }

  expand_paths(cfg);

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

}  // namespace pl
