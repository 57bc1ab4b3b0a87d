// File: include/pl/core/encoding/encoding_coordinator.hpp
#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "pl/core/config.hpp"
#include "pl/core/encoding/video_encoder.hpp"
#include "pl/core/status.hpp"
#include "pl/core/storage/mount_monitor.hpp"

namespace pl {

struct RecoveryReport {
  int reset_to_ready = 0;   // stale in-progress sessions re-queued
  int marked_ready = 0;     // abandoned captures queued
  int marked_complete = 0;  // videos that lost their marker
  int stray_removed = 0;    // ready markers next to a terminal marker
};

struct CoordinatorTick {
  // Session the tick acted on (started or finished), empty otherwise.
  SessionName session;

  bool started = false;
  std::optional<EncodeOutcome> finished;

  // True while an encode is still running.
  bool busy = false;
};

// Finds encodable sessions on the primary store and runs them one at a time.
class EncodingCoordinator {
 public:
  EncodingCoordinator(const Config& cfg, IMountMonitor& mount, VideoEncoder& encoder);

  // Ready, not in progress, not terminal, no video yet. Sorted by name.
  std::vector<std::filesystem::path> find_pending_sessions() const;

  Result<bool> claim(const std::filesystem::path& session_dir) const;

  // In-progress markers older than `max_age`: partial video removed, back to ready.
  RecoveryReport recover_stale(std::chrono::seconds max_age) const;

  // Sessions with no markers: frames and capture heartbeat both idle for `min_idle` ->
  // ready, video present -> complete. Also removes ready markers that sit next to a terminal marker.
  RecoveryReport recover_abandoned(std::chrono::seconds min_idle) const;

  // Polls the running encode, or claims and starts the next pending session.
  CoordinatorTick tick();

  // Kill the running encode and hand its session back to ready (shutdown path).
  void abort_active();

  bool busy() const { return active_.has_value(); }

 private:
  std::filesystem::path root_;
  std::string frame_ext_;
  std::chrono::seconds probe_timeout_;

  IMountMonitor& mount_;
  VideoEncoder& encoder_;

  std::optional<EncodeJob> active_;
};

}  // namespace pl
