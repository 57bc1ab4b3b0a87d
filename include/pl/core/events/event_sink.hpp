// File: include/pl/core/events/event_sink.hpp
#pragma once

#include <optional>
#include <string>

#include "pl/core/status.hpp"
#include "pl/core/types.hpp"

namespace pl {

// Machine-readable lifecycle trail. Keep output stable and boring; evolve by adding
// fields (not breaking existing ones).

struct RunInfo {
  std::string service;  // "capture" | "encoder" | "uploader"
  std::string config_path;
  std::string out_dir;

  std::string config_hash;

  TimestampNs start_time_ns;       // always 0 (relative)
  TimestampNs wall_start_time_ns;  // epoch
};

struct Event {
  std::string type;  // e.g. "session_started", "frame_dropped", "encode_finished"
  TimestampNs t_ns;
  TimestampNs t_wall_ns;

  // Empty when the event is not tied to a session.
  SessionName session;
  std::optional<int> frame_count;

  std::string message;  // optional human-readable hint
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace pl
