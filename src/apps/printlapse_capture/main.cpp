// File: src/apps/printlapse_capture/main.cpp
#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "pl/adapters/camera/command_frame_source.hpp"
#include "pl/adapters/http/http_client.hpp"
#include "pl/adapters/prusalink/prusalink_poller.hpp"
#include "pl/core/capture/capture_service.hpp"
#include "pl/core/events/jsonl_event_sink.hpp"
#include "pl/core/model/service_runner.hpp"
#include "pl/core/session/control_file.hpp"
#include "pl/core/session/session_controller.hpp"
#include "pl/core/storage/dual_tier_store.hpp"
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
  std::cout << "printlapse_capture\n"
            << "  --config <path>\n";
}

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

  const pl::Status st_log = pl::init_logging("capture", cfg.logging.level);
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return 1;
  }

  pl::HttpGlobal http;
  pl::install_stop_handlers();

  pl::ServiceRunner runner("capture", cfg, args.config_path);
  pl::JsonlEventSink sink;

  const pl::Status st_start = runner.start(sink);
  if (!st_start.ok()) {
    spdlog::error("[capture] {}", st_start.message());
    return 2;
  }

  // Ensure we always flush/close the event trail.
  struct Guard {
    pl::ServiceRunner& r;
    pl::JsonlEventSink& s;
    ~Guard() { r.stop(s); }
  } guard{runner, sink};

  spdlog::info("[capture] events: {} (latest: {})", sink.path(), sink.latest_path());
  spdlog::info("[capture] printer {}  poll={}s  capture={}s  primary={}  fallback={}",
               cfg.printer.host, cfg.printer.poll_interval_s, cfg.timelapse.capture_interval_s,
               cfg.storage.primary_root, cfg.storage.fallback_root);

  pl::PrusaLinkPoller poller(cfg.printer);
  pl::CommandFrameSource camera(cfg.camera);
  pl::DualTierStore store(cfg.storage);
  pl::MountHealthMonitor mount(cfg.mount);
  pl::CaptureService service(cfg, camera, store, mount, runner, sink);
  pl::SessionController controller(cfg.timelapse, cfg.printer.poll_interval_s, service);
  pl::ControlFile control(cfg.timelapse.control_file);
  pl::SessionControllerState state;

  using clock = std::chrono::steady_clock;
  const auto t0 = clock::now();
  auto now_s = [t0]() { return std::chrono::duration<double>(clock::now() - t0).count(); };

  service.check_primary(now_s(), /*force=*/true);
  if (store.primary_healthy() && store.has_fallback_data()) {
    const pl::ReconcileReport rep = store.reconcile();
    runner.record_event(sink, "reconcile",
                        "startup: " + std::to_string(rep.frames_transferred) + " frames");
  }

  while (!pl::stop_requested()) {
    double sleep_s = static_cast<double>(cfg.printer.poll_interval_s);
    try {
      service.check_primary(now_s());

      pl::TickInput in;
      in.manual_session = control.read();
      auto status = poller.poll();
      if (status.ok()) {
        in.status = status.take_value();
      } else if (status.status().is_transient()) {
        spdlog::debug("[capture] status query failed: {}", status.status().message());
      } else {
        spdlog::warn("[capture] status query failed ({}): {}",
                     pl::status_code_name(status.status().code()), status.status().message());
      }
      in.now_s = now_s();
      in.wall = std::chrono::system_clock::now();

      const pl::TickResult r = controller.tick(state, in);
      sleep_s = r.sleep_s;

      if (runner.heartbeat_due()) {
        const std::string msg =
            std::string("primary=") + (store.primary_healthy() ? "healthy" : "unhealthy") +
            " dropped=" + std::to_string(service.frames_dropped());
        runner.record_event(sink, "heartbeat", msg,
                            state.session ? state.session->name : pl::SessionName{},
                            state.session ? std::optional<int>(state.session->frame_count)
                                          : std::nullopt);
      }
    } catch (const std::exception& e) {
      spdlog::error("[capture] unexpected error: {} (cooling down {}s)", e.what(),
                    cfg.timelapse.error_cooldown_s);
      sleep_s = static_cast<double>(cfg.timelapse.error_cooldown_s);
    }
    (void)pl::sleep_unless_stopped(sleep_s);
  }

  spdlog::info("[capture] stopping");
  if (auto closed = controller.finalize(state, "shutdown")) {
    spdlog::info("[capture] finalized {} ({} frames)", closed->name, closed->frame_count);
  }
  runner.record_event(sink, "shutdown", "signal");
  return 0;
}
