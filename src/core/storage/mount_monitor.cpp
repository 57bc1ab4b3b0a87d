// File: src/core/storage/mount_monitor.cpp
#include "pl/core/storage/mount_monitor.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "pl/core/util/deadline.hpp"
#include "pl/core/util/subprocess.hpp"

namespace pl {

MountHealthMonitor::MountHealthMonitor(MountConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> MountHealthMonitor::with_prefix(const std::vector<std::string>& cmd) const {
  std::vector<std::string> argv;
  if (!cfg_.sudo.empty()) argv.push_back(cfg_.sudo);
  argv.insert(argv.end(), cmd.begin(), cmd.end());
  argv.push_back(cfg_.mount_point);
  return argv;
}

std::vector<std::string> MountHealthMonitor::detach_argv() const { return with_prefix(cfg_.detach_command); }
std::vector<std::string> MountHealthMonitor::mount_argv() const { return with_prefix(cfg_.mount_command); }

bool MountHealthMonitor::is_healthy(std::chrono::seconds timeout) {
  const std::string root = cfg_.mount_point;
  const Status st = stat_gate_.run(
      [root]() -> Status {
        struct stat sb {};
        if (::stat(root.c_str(), &sb) != 0) {
          return Status::unavailable("stat " + root + ": " + std::strerror(errno));
        }
        if (!S_ISDIR(sb.st_mode)) return Status::unavailable(root + " is not a directory");
        return Status::ok_status();
      },
      timeout, "mount probe");

  if (!st.ok()) spdlog::debug("[MountHealthMonitor] {} unhealthy: {}", cfg_.mount_point, st.message());
  return st.ok();
}

bool MountHealthMonitor::is_writable(std::chrono::seconds timeout) {
  const std::filesystem::path probe =
      std::filesystem::path(cfg_.mount_point) / (".health_check_" + std::to_string(::getpid()));
  const Status st = write_gate_.run(
      [probe]() -> Status {
        {
          std::ofstream f(probe, std::ios::out | std::ios::trunc);
          if (!f.is_open()) return Status::unavailable("cannot create " + probe.string());
          f << "health_check\n";
          f.flush();
          if (!f.good()) return Status::unavailable("cannot write " + probe.string());
        }
        std::error_code ec;
        std::filesystem::remove(probe, ec);
        if (ec) return Status::unavailable("cannot remove " + probe.string() + ": " + ec.message());
        return Status::ok_status();
      },
      timeout, "mount write probe");

  if (!st.ok()) spdlog::warn("[MountHealthMonitor] write probe failed: {}", st.message());
  return st.ok();
}

bool MountHealthMonitor::try_remount() {
  if (is_healthy()) return true;

  spdlog::warn("[MountHealthMonitor] mount stale at {}, attempting remount", cfg_.mount_point);

  // May fail when nothing is mounted; the mount step below decides.
  const auto detach = detach_argv();
  auto detach_r = run_process(detach, std::chrono::seconds(cfg_.detach_timeout_s));
  if (!detach_r.ok()) {
    spdlog::warn("[MountHealthMonitor] detach could not run: {}", detach_r.status().message());
  } else if (!detach_r->success()) {
    spdlog::debug("[MountHealthMonitor] detach {}: {}", detach_r->describe(), detach_r->output);
  }

  std::this_thread::sleep_for(std::chrono::seconds(cfg_.settle_s));

  const auto mount = mount_argv();
  auto mount_r = run_process(mount, std::chrono::seconds(cfg_.mount_timeout_s));
  if (!mount_r.ok()) {
    spdlog::error("[MountHealthMonitor] remount could not run: {}", mount_r.status().message());
    return false;
  }
  if (mount_r->timed_out) {
    spdlog::error("[MountHealthMonitor] remount timed out after {}s", cfg_.mount_timeout_s);
    return false;
  }
  if (!mount_r->success()) {
    spdlog::error("[MountHealthMonitor] remount failed ({}): {}", mount_r->describe(),
                  mount_r->output.empty() ? "unknown error" : mount_r->output);
    return false;
  }
  // Checks stuck on the detached mount will never report back.
  const bool stat_stuck = stat_gate_.abandon();
  const bool write_stuck = write_gate_.abandon();
  if (stat_stuck || write_stuck) {
    spdlog::warn("[MountHealthMonitor] abandoning a health check blocked on the previous mount");
  }
  if (!is_healthy()) {
    spdlog::error("[MountHealthMonitor] remount reported success but {} is still unreachable",
                  cfg_.mount_point);
    return false;
  }

  spdlog::info("[MountHealthMonitor] remount successful");
  return true;
}

}  // namespace pl
