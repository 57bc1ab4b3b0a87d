// File: src/apps/printlapse_uploader/main.cpp
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "pl/adapters/camera/command_frame_source.hpp"
#include "pl/adapters/http/http_client.hpp"
#include "pl/adapters/prusa_connect/snapshot_uploader.hpp"
#include "pl/core/events/jsonl_event_sink.hpp"
#include "pl/core/model/service_runner.hpp"
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
  std::cout << "printlapse_uploader\n"
            << "  --config <path>\n";
}

// The capture daemon owns camera.snapshot_path; keep a separate file.
std::string upload_snapshot_path(const std::string& p) {
  const std::filesystem::path path(p);
  return (path.parent_path() / (path.stem().string() + "_upload" + path.extension().string())).string();
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

  const pl::Status st_log = pl::init_logging("uploader", cfg.logging.level);
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return 1;
  }
  if (!cfg.upload.enabled) {
    spdlog::error("[uploader] upload.enabled is false; nothing to do");
    return 1;
  }

  pl::HttpGlobal http;
  pl::install_stop_handlers();

  pl::ServiceRunner runner("uploader", cfg, args.config_path);
  pl::JsonlEventSink sink;

  const pl::Status st_start = runner.start(sink);
  if (!st_start.ok()) {
    spdlog::error("[uploader] {}", st_start.message());
    return 2;
  }

  struct Guard {
    pl::ServiceRunner& r;
    pl::JsonlEventSink& s;
    ~Guard() { r.stop(s); }
  } guard{runner, sink};

  pl::CameraConfig cam = cfg.camera;
  cam.snapshot_path = upload_snapshot_path(cam.snapshot_path);
  pl::CommandFrameSource camera(cam);
  pl::SnapshotUploader uploader(cfg.upload, camera);

  spdlog::info("[uploader] uploading every {}s at {}x{}", cfg.upload.interval_s, cam.width,
               cam.height);

  while (!pl::stop_requested()) {
    int sleep_s = cfg.upload.interval_s;
    try {
      sleep_s = uploader.cycle();
      if (runner.heartbeat_due()) {
        runner.record_event(
            sink, "heartbeat", "consecutive_failures=" + std::to_string(uploader.consecutive_failures()));
      }
    } catch (const std::exception& e) {
      spdlog::error("[uploader] unexpected error: {}", e.what());
      sleep_s = 30;
    }
    (void)pl::sleep_unless_stopped(static_cast<double>(sleep_s));
  }

  spdlog::info("[uploader] stopping");
  runner.record_event(sink, "shutdown", "signal");
  return 0;
}
