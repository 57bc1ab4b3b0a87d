// File: tests/test_util.hpp
#pragma once

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include "pl/core/events/event_sink.hpp"

namespace pl::test {

// mkdtemp-backed scratch directory, removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "pl_test_XXXXXX").string();
    const char* made = ::mkdtemp(tmpl.data());
    if (made != nullptr) path_ = made;
  }
  ~TempDir() {
    std::error_code ec;
    if (!path_.empty()) std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

 private:
  std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& p, const std::string& content) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  f << content;
}

inline std::string read_file(const std::filesystem::path& p) {
  std::ifstream f(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// Shell script with the exec bit set.
inline void write_script(const std::filesystem::path& p, const std::string& body) {
  write_file(p, "#!/bin/sh\n" + body + "\n");
  ::chmod(p.c_str(), 0755);
}

// Push a file's mtime into the past.
inline void age_file(const std::filesystem::path& p, std::chrono::seconds by) {
  const auto now = std::filesystem::file_time_type::clock::now();
  std::filesystem::last_write_time(p, now - by);
}

// Keeps every event for assertions.
class RecordingEventSink final : public EventSink {
 public:
  Status open(const RunInfo&) override { return Status::ok_status(); }
  Status emit(const Event& e) override {
    events.push_back(e);
    return Status::ok_status();
  }
  Status flush() override { return Status::ok_status(); }
  void close() override {}

  int count(const std::string& type) const {
    int n = 0;
    for (const auto& e : events) {
      if (e.type == type) ++n;
    }
    return n;
  }

  std::vector<Event> events;
};

}  // namespace pl::test
