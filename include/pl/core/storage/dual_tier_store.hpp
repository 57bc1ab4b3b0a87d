// File: include/pl/core/storage/dual_tier_store.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "pl/core/config.hpp"
#include "pl/core/status.hpp"
#include "pl/core/types.hpp"

namespace pl {

// Free space (MB) of the filesystem holding the given path.
using FreeSpaceProbe = std::function<Result<std::int64_t>(const std::filesystem::path&)>;

struct ReconcileReport {
  int sessions_completed = 0;
  int frames_transferred = 0;
  int markers_recreated = 0;

  // False when the pass stopped early; the remainder waits for the next pass.
  bool finished = true;
  std::string stopped_reason;
};

// Frame storage with a network primary and a local fallback mirror.
//
// Primary writes are bounded by `copy_timeout_s`; the first failure flips the store to
// the fallback tree until set_primary_healthy(true) is called, which then reconciles the
// fallback tree back to primary.
class DualTierStore {
 public:
  explicit DualTierStore(StorageConfig cfg, FreeSpaceProbe free_space = {});

  // Ensure the session's frames/ directory exists (primary, else fallback).
  Result<StoreTier> open_session(const SessionName& session);

  // Copy `source` to frame `index` of `session`. Errors:
  //  - resource_exhausted when primary is down and local free space is below the margin
  //  - io_error when even the fallback copy failed
  Result<StoreTier> write_frame(const SessionName& session, int index,
                                const std::filesystem::path& source);

  // Touch the session's capture heartbeat on primary so the encoder does not take an
  // open but idle (paused) session for an abandoned one. No-op while primary is down.
  Status touch_live(const SessionName& session);

  // Close the session for capture: clear the heartbeat and write ready-for-encoding.
  // Goes to the fallback tree while any of the session's frames are still there, so the
  // marker never reaches primary ahead of its frames. A session the encoder already
  // finished without the latest frames is re-queued.
  Result<StoreTier> mark_ready(const SessionName& session);

  // Reports the latest health verdict. An unhealthy -> healthy transition runs
  // reconcile() and returns its report.
  std::optional<ReconcileReport> set_primary_healthy(bool healthy);

  ReconcileReport reconcile();

  [[nodiscard]] bool primary_healthy() const { return primary_healthy_; }
  [[nodiscard]] bool disk_full() const { return disk_full_warned_; }
  [[nodiscard]] bool has_fallback_data() const;

  const std::filesystem::path& primary_root() const { return primary_root_; }
  const std::filesystem::path& fallback_root() const { return fallback_root_; }

 private:
  Status write_primary(const std::filesystem::path& dst, const std::filesystem::path& source);
  Result<StoreTier> write_fallback(const std::filesystem::path& dst,
                                   const std::filesystem::path& source);
  void mark_primary_down(const std::string& why);
  Status close_on_primary(const std::filesystem::path& session_dir);
  bool fallback_has_frames(const SessionName& session) const;

  StorageConfig cfg_;
  std::filesystem::path primary_root_;
  std::filesystem::path fallback_root_;
  std::chrono::seconds copy_timeout_;
  FreeSpaceProbe free_space_;

  bool primary_healthy_ = true;
  bool disk_full_warned_ = false;
};

}  // namespace pl
