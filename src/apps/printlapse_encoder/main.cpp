// File: src/apps/printlapse_encoder/main.cpp
#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "pl/core/encoding/encoding_coordinator.hpp"
#include "pl/core/encoding/video_encoder.hpp"
#include "pl/core/events/jsonl_event_sink.hpp"
#include "pl/core/model/service_runner.hpp"
#include "pl/core/storage/mount_monitor.hpp"
#include "pl/core/util/config_loader.hpp"
#include "pl/core/util/logging.hpp"
#include "pl/core/util/shutdown.hpp"

namespace {

struct Args {
  std::string config_path;
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "printlapse_encoder\n"
            << "  --config <path>\n";
}

std::chrono::seconds hours(double h) {
  return std::chrono::seconds(static_cast<long long>(h * 3600.0));
}

// While an encode runs the child is polled this often.
constexpr double kBusyPollS = 2.0;

// Abandoned captures are looked for again after this much idle time.
constexpr auto kRecoveryPeriod = std::chrono::hours(1);

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = pl::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  const pl::Config cfg = cfg_r.take_value();

  const pl::Status st_log = pl::init_logging("encoder", cfg.logging.level);
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return 1;
  }
  pl::install_stop_handlers();

  pl::ServiceRunner runner("encoder", cfg, args.config_path);
  pl::JsonlEventSink sink;

  const pl::Status st_start = runner.start(sink);
  if (!st_start.ok()) {
    spdlog::error("[encoder] {}", st_start.message());
    return 2;
  }

  struct Guard {
    pl::ServiceRunner& r;
    pl::JsonlEventSink& s;
    ~Guard() { r.stop(s); }
  } guard{runner, sink};

  if (!cfg.video.enabled) {
    spdlog::info("[encoder] video.enabled is false; idling");
    while (pl::sleep_unless_stopped(static_cast<double>(cfg.encoder.check_interval_s))) {
    }
    runner.record_event(sink, "shutdown", "signal");
    return 0;
  }

  spdlog::info("[encoder] watching {} every {}s ({} fps, crf {}, preset {}, rotation {})",
               cfg.storage.primary_root, cfg.encoder.check_interval_s, cfg.video.frame_rate,
               cfg.video.crf, cfg.video.preset, cfg.video.rotation_deg);

  pl::MountHealthMonitor mount(cfg.mount);
  pl::VideoEncoder encoder(cfg.video, cfg.storage.frame_ext,
                           std::chrono::seconds(cfg.storage.copy_timeout_s));
  pl::EncodingCoordinator coordinator(cfg, mount, encoder);

  const auto probe = std::chrono::seconds(cfg.encoder.health_probe_timeout_s);
  using clock = std::chrono::steady_clock;
  auto last_recovery = clock::time_point{};
  bool recovered_once = false;

  while (!pl::stop_requested()) {
    double sleep_s = static_cast<double>(cfg.encoder.check_interval_s);
    try {
      // Recovery needs a reachable store; it runs first thing once the mount is up.
      if (!coordinator.busy() &&
          (!recovered_once || clock::now() - last_recovery >= kRecoveryPeriod) &&
          mount.is_healthy(probe)) {
        pl::RecoveryReport rep = coordinator.recover_stale(hours(cfg.encoder.stale_age_hours));
        const pl::RecoveryReport ab = coordinator.recover_abandoned(hours(cfg.encoder.abandoned_age_hours));
        rep.marked_ready = ab.marked_ready;
        rep.marked_complete = ab.marked_complete;
        rep.stray_removed = ab.stray_removed;
        if (rep.reset_to_ready + rep.marked_ready + rep.marked_complete + rep.stray_removed > 0) {
          runner.record_event(sink, "recovery",
                              "stale=" + std::to_string(rep.reset_to_ready) +
                                  " abandoned=" + std::to_string(rep.marked_ready) +
                                  " completed=" + std::to_string(rep.marked_complete) +
                                  " stray=" + std::to_string(rep.stray_removed));
        }
        last_recovery = clock::now();
        recovered_once = true;
      }

      const pl::CoordinatorTick t = coordinator.tick();
      if (t.started) runner.record_event(sink, "encode_started", "", t.session);
      if (t.finished) {
        runner.record_event(sink, "encode_finished", pl::to_string(*t.finished), t.session);
      }

      if (coordinator.busy()) {
        sleep_s = std::min(kBusyPollS, sleep_s);
      } else if (t.finished) {
        sleep_s = 1.0;  // look for the next pending session right away
      }

      if (runner.heartbeat_due()) {
        runner.record_event(sink, "heartbeat", coordinator.busy() ? "encoding" : "idle");
      }
    } catch (const std::exception& e) {
      spdlog::error("[encoder] unexpected error: {} (cooling down {}s)", e.what(),
                    cfg.timelapse.error_cooldown_s);
      sleep_s = static_cast<double>(cfg.timelapse.error_cooldown_s);
    }
    (void)pl::sleep_unless_stopped(sleep_s);
  }

  spdlog::info("[encoder] stopping");
  coordinator.abort_active();
  runner.record_event(sink, "shutdown", "signal");
  return 0;
}
