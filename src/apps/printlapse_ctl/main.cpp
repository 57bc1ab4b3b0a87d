// File: src/apps/printlapse_ctl/main.cpp
#include <iostream>
#include <string>

#include "pl/core/session/control_file.hpp"
#include "pl/core/storage/session_markers.hpp"
#include "pl/core/util/config_loader.hpp"
#include "pl/core/util/fs_util.hpp"

namespace {

struct Args {
  std::string config_path;
  std::string command;  // start | stop | status
  std::string name;
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
    if (a.command.empty()) {
      a.command = s;
      continue;
    }
    if (a.command == "start" && a.name.empty()) {
      a.name = s;
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "printlapse_ctl\n"
            << "  --config <path> start <name>   begin a manual recording\n"
            << "  --config <path> stop           end the manual recording\n"
            << "  --config <path> status         show recording and session state\n";
}

int cmd_status(const pl::Config& cfg, const pl::ControlFile& control) {
  if (auto name = control.read()) {
    std::cout << "Manual recording: " << *name << "\n";
  } else {
    std::cout << "Manual recording: none\n";
  }

  auto dirs = pl::list_session_dirs(cfg.storage.primary_root);
  if (!dirs.ok()) {
    std::cerr << dirs.status().message() << "\n";
    return 1;
  }

  std::cout << "Sessions in " << cfg.storage.primary_root << ":\n";
  for (const auto& dir : *dirs) {
    auto snap = pl::inspect_session(dir, cfg.storage.frame_ext, cfg.video.video_ext);
    if (!snap.ok()) {
      std::cout << "  " << dir.filename().string() << "  (" << snap.status().message() << ")\n";
      continue;
    }
    std::cout << "  " << snap->name << "  frames=" << snap->frame_count
              << "  state=" << pl::to_string(snap->state) << (snap->has_video ? "  video" : "")
              << "\n";
  }

  auto local = pl::list_session_dirs(cfg.storage.fallback_root);
  if (local.ok() && !local->empty()) {
    std::cout << "Awaiting transfer in " << cfg.storage.fallback_root << ":\n";
    for (const auto& dir : *local) {
      auto frames = pl::list_frames(pl::layout::frames_dir(dir), cfg.storage.frame_ext);
      std::cout << "  " << dir.filename().string()
                << "  frames=" << (frames.ok() ? frames->size() : 0) << "\n";
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty() || args.command.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = pl::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  const pl::Config cfg = cfg_r.take_value();
  pl::ControlFile control(cfg.timelapse.control_file);

  if (args.command == "start") {
    if (args.name.empty()) {
      print_usage();
      return 2;
    }
    if (auto current = control.read()) {
      std::cerr << "Already recording: " << *current << "\n";
      return 1;
    }
    const pl::Status st = control.start(args.name);
    if (!st.ok()) {
      std::cerr << st.message() << "\n";
      return 1;
    }
    std::cout << "Recording requested: " << pl::sanitize_name(args.name) << "\n";
    return 0;
  }

  if (args.command == "stop") {
    auto was = control.stop();
    if (!was.ok()) {
      std::cerr << was.status().message() << "\n";
      return 1;
    }
    if (!*was) {
      std::cout << "No manual recording active\n";
      return 0;
    }
    std::cout << "Recording stopped: " << **was << "\n";
    return 0;
  }

  if (args.command == "status") return cmd_status(cfg, control);

  print_usage();
  return 2;
}
