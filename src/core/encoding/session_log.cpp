// File: src/core/encoding/session_log.cpp
#include "pl/core/encoding/session_log.hpp"

#include <ctime>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "pl/core/storage/session_markers.hpp"

namespace pl {
namespace {

std::string local_stamp() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

// "MemTotal:  3884332 kB" -> 3884332
long long meminfo_kb(const std::string& line) {
  std::istringstream ss(line);
  std::string key;
  long long kb = 0;
  ss >> key >> kb;
  return ss.fail() ? 0 : kb;
}

}  // namespace

SessionLog::SessionLog(std::filesystem::path session_dir)
    : session_(session_dir.filename().string()), path_(session_dir / layout::kEncodingLog) {}

void SessionLog::append(const std::string& line) const {
  std::ofstream f(path_, std::ios::out | std::ios::app);
  if (f.is_open()) f << "[" << local_stamp() << "] " << line << "\n";
  if (!f.is_open() || !f.good()) {
    spdlog::warn("[VideoEncoder] could not write {}", path_.string());
  }
}

void SessionLog::info(const std::string& message) const {
  spdlog::info("[VideoEncoder] {}: {}", session_, message);
  append(message);
}

void SessionLog::error(const std::string& message) const {
  spdlog::error("[VideoEncoder] {}: {}", session_, message);
  append("ERROR: " + message);
}

void SessionLog::memory_snapshot() const {
  std::ifstream f("/proc/meminfo");
  if (!f.is_open()) return;

  long long total_kb = 0;
  long long avail_kb = 0;
  std::string line;
  while (std::getline(f, line)) {
    if (line.rfind("MemTotal:", 0) == 0) total_kb = meminfo_kb(line);
    else if (line.rfind("MemAvailable:", 0) == 0) avail_kb = meminfo_kb(line);
  }
  if (total_kb <= 0) return;

  info("System memory: " + std::to_string(avail_kb / 1024) + "MB free of " +
       std::to_string(total_kb / 1024) + "MB");
}

}  // namespace pl
