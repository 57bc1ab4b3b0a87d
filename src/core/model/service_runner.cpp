// File: src/core/model/service_runner.cpp
#include "pl/core/model/service_runner.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "pl/core/util/repro_hash.hpp"

namespace pl {
namespace {

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::int64_t parse_events_epoch_ns_from_name(const std::string& name, const std::string& service) {
  const std::string prefix = service + "_events_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == prefix + "latest" + suffix) return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid =
      name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid)) return -1;

  try {
    return std::stoll(mid);
  } catch (const std::out_of_range&) {
    return -1;
  }
}

}  // namespace

ServiceRunner::ServiceRunner(std::string service, Config cfg, std::string config_path)
    : service_(std::move(service)), cfg_(std::move(cfg)), config_path_(std::move(config_path)) {}

TimestampNs ServiceRunner::wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

TimestampNs ServiceRunner::since_start_ns() const {
  if (!started_) return TimestampNs{0};
  const auto now = std::chrono::steady_clock::now();
  const auto ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(now - t0_steady_).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

void ServiceRunner::prune_out_dir(const std::string& out_dir, const std::string& service,
                                  std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::string name = it.path().filename().string();
    const std::int64_t k = parse_events_epoch_ns_from_name(name, service);
    if (k < 0) continue;

    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status ServiceRunner::start(EventSink& sink) {
  prune_out_dir(cfg_.output.events_dir, service_,
                static_cast<std::size_t>(cfg_.output.keep_runs));

  t0_steady_ = std::chrono::steady_clock::now();
  last_heartbeat_ = t0_steady_;
  t0_wall_ns_ = wall_now_epoch_ns();
  started_ = true;

  RunInfo run;
  run.service = service_;
  run.config_path = config_path_;
  run.out_dir = cfg_.output.events_dir;
  run.config_hash = compute_config_hash(cfg_);

  // Contract: logical time starts at zero. Wall time is absolute epoch.
  run.start_time_ns = TimestampNs{0};
  run.wall_start_time_ns = t0_wall_ns_;

  return sink.open(run);
}

bool ServiceRunner::heartbeat_due() {
  if (cfg_.output.heartbeat_period_s <= 0) return false;
  const auto now = std::chrono::steady_clock::now();
  if (now - last_heartbeat_ < std::chrono::seconds(cfg_.output.heartbeat_period_s)) return false;
  last_heartbeat_ = now;
  return true;
}

bool ServiceRunner::record_event(EventSink& sink, const std::string& type,
                                 const std::string& message, const SessionName& session,
                                 std::optional<int> frame_count) {
  const Status st = emit_event(sink, type, message, session, frame_count);
  if (st.ok()) return true;
  spdlog::warn("[{}] event '{}' not recorded: {}", service_, type, st.message());
  return false;
}

Status ServiceRunner::emit_event(EventSink& sink, const std::string& type,
                                 const std::string& message, const SessionName& session,
                                 std::optional<int> frame_count) {
  Event e;
  e.type = type;
  e.t_ns = since_start_ns();
  e.t_wall_ns = wall_now_epoch_ns();
  e.session = session;
  e.frame_count = frame_count;
  e.message = message;
  const Status st = sink.emit(e);
  if (!st.ok()) return st;
  return sink.flush();
}

void ServiceRunner::stop(EventSink& sink) {
  const Status st = sink.flush();
  if (!st.ok()) spdlog::warn("[{}] event trail not flushed on stop: {}", service_, st.message());
  sink.close();
  started_ = false;
}

}  // namespace pl
