// File: include/pl/core/events/jsonl_event_sink.hpp
#pragma once

#include <array>
#include <cstddef>
#include <fstream>
#include <string>

#include "pl/core/events/event_sink.hpp"
#include "pl/core/status.hpp"

namespace pl {

// One JSON object per line, mirrored into two files under `RunInfo::out_dir`:
//   <service>_events_<wall_start_ns>.jsonl  kept per run (pruned by ServiceRunner)
//   <service>_events_latest.jsonl           truncated at every open, for `tail -f`
//
// Every line carries "type", "t_ns"/"t_s" (since run start) and "t_wall_ns"/"t_wall_s".
class JsonlEventSink final : public EventSink {
 public:
  JsonlEventSink() = default;
  ~JsonlEventSink() override;

  JsonlEventSink(const JsonlEventSink&) = delete;
  JsonlEventSink& operator=(const JsonlEventSink&) = delete;

  const std::string& path() const { return files_[kRun].path; }
  const std::string& latest_path() const { return files_[kLatest].path; }

  Status open(const RunInfo& run) override;
  Status emit(const Event& e) override;
  Status flush() override;
  void close() override;

 private:
  enum : std::size_t { kRun = 0, kLatest = 1 };

  struct File {
    std::string path;
    std::ofstream out;
  };

  Status write_line_(const std::string& line);

  bool open_{false};
  std::array<File, 2> files_;
};

// Escapes quotes, backslashes and control characters for a JSON string body.
std::string json_escape(const std::string& s);

}  // namespace pl
