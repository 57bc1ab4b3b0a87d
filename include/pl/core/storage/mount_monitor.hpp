// File: include/pl/core/storage/mount_monitor.hpp
#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "pl/core/config.hpp"
#include "pl/core/status.hpp"
#include "pl/core/util/deadline.hpp"

namespace pl {

class IMountMonitor {
 public:
  virtual ~IMountMonitor() = default;

  // Bounded stat of the mount root. A hung network filesystem reads as unhealthy.
  // Implementations keep at most one health check blocked on the mount at any time.
  virtual bool is_healthy(std::chrono::seconds timeout) = 0;

  // Bounded write + delete of a probe file under the mount root.
  virtual bool is_writable(std::chrono::seconds timeout) = 0;

  // Detach the stale mount, pause, remount from fstab and re-probe.
  // Returns true when the mount is healthy afterwards.
  virtual bool try_remount() = 0;
};

class MountHealthMonitor final : public IMountMonitor {
 public:
  explicit MountHealthMonitor(MountConfig cfg);

  bool is_healthy(std::chrono::seconds timeout) override;
  bool is_writable(std::chrono::seconds timeout) override;
  bool try_remount() override;

  bool is_healthy() { return is_healthy(std::chrono::seconds(cfg_.probe_timeout_s)); }

  // Command lines used by try_remount(), exposed for logs and tests.
  std::vector<std::string> detach_argv() const;
  std::vector<std::string> mount_argv() const;

  // Health-check workers started so far (stat + write).
  int check_workers_started() const {
    return stat_gate_.workers_started() + write_gate_.workers_started();
  }

 private:
  std::vector<std::string> with_prefix(const std::vector<std::string>& cmd) const;

  MountConfig cfg_;

  SingleFlight stat_gate_;
  SingleFlight write_gate_;
};

}  // namespace pl
