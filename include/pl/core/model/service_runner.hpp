// File: include/pl/core/model/service_runner.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "pl/core/config.hpp"
#include "pl/core/events/event_sink.hpp"
#include "pl/core/status.hpp"
#include "pl/core/types.hpp"  // TimestampNs

namespace pl {

// ServiceRunner owns the event-trail lifecycle of one daemon.
// Time contract:
//  - t_ns      = relative since run start (starts at 0) using steady clock
//  - t_wall_ns = absolute epoch ns
class ServiceRunner {
 public:
  ServiceRunner(std::string service, Config cfg, std::string config_path);

  Status start(EventSink& sink);

  Status emit_event(EventSink& sink, const std::string& type, const std::string& message,
                    const SessionName& session = {},
                    std::optional<int> frame_count = std::nullopt);

  // emit_event for daemon loops: a failed write is logged, never fatal.
  // Returns false when the event was not recorded.
  bool record_event(EventSink& sink, const std::string& type, const std::string& message,
                    const SessionName& session = {},
                    std::optional<int> frame_count = std::nullopt);

  void stop(EventSink& sink);

  // True once per `heartbeat_period_s` (never when the period is 0).
  bool heartbeat_due();

  const std::string& service() const { return service_; }

 private:
  static TimestampNs wall_now_epoch_ns();
  TimestampNs since_start_ns() const;

  static void prune_out_dir(const std::string& out_dir, const std::string& service,
                            std::size_t keep_last);

  std::string service_;
  Config cfg_;
  std::string config_path_;

  std::chrono::steady_clock::time_point t0_steady_{};
  std::chrono::steady_clock::time_point last_heartbeat_{};
  TimestampNs t0_wall_ns_{0};
  bool started_{false};
};

}  // namespace pl
