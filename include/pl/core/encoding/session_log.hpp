// File: include/pl/core/encoding/session_log.hpp
#pragma once

#include <filesystem>
#include <string>

namespace pl {

// Appends "[YYYY-mm-dd HH:MM:SS] message" lines to <session>/encoding.log and mirrors
// them to the process log. Failing to write the file is logged, never fatal.
class SessionLog {
 public:
  explicit SessionLog(std::filesystem::path session_dir);

  void info(const std::string& message) const;
  void error(const std::string& message) const;

  // "System memory: <avail>MB free of <total>MB" from /proc/meminfo (skipped if unreadable).
  void memory_snapshot() const;

  const std::filesystem::path& path() const { return path_; }

 private:
  void append(const std::string& line) const;

  std::string session_;
  std::filesystem::path path_;
};

}  // namespace pl
