// File: src/core/events/jsonl_event_sink.cpp
#include "pl/core/events/jsonl_event_sink.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>

namespace pl {
namespace {

// Builds a flat JSON object field by field.
class JsonLine {
 public:
  JsonLine() { ss_ << std::fixed << std::setprecision(6) << '{'; }

  JsonLine& str(const char* key, const std::string& v) {
    key_(key);
    ss_ << '"' << json_escape(v) << '"';
    return *this;
  }

  JsonLine& i64(const char* key, std::int64_t v) {
    key_(key);
    ss_ << v;
    return *this;
  }

  // Time as both integer ns and fractional seconds.
  JsonLine& time(const char* key, TimestampNs t) {
    const std::string k(key);
    i64((k + "_ns").c_str(), t.ns);
    key_((k + "_s").c_str());
    ss_ << static_cast<double>(t.ns) * 1e-9;
    return *this;
  }

  std::string done() {
    ss_ << '}';
    return ss_.str();
  }

 private:
  void key_(const char* key) {
    if (!first_) ss_ << ',';
    first_ = false;
    ss_ << '"' << key << "\":";
  }

  std::ostringstream ss_;
  bool first_ = true;
};

}  // namespace

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  return out;
}

JsonlEventSink::~JsonlEventSink() { close(); }

Status JsonlEventSink::open(const RunInfo& run) {
  namespace fs = std::filesystem;
  close();

  std::error_code ec;
  fs::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating events dir '" + run.out_dir + "': " + ec.message());
  }

  const fs::path dir(run.out_dir);
  files_[kRun].path =
      (dir / (run.service + "_events_" + std::to_string(run.wall_start_time_ns.ns) + ".jsonl"))
          .string();
  files_[kLatest].path = (dir / (run.service + "_events_latest.jsonl")).string();

  for (File& f : files_) {
    f.out.open(f.path, std::ios::out | std::ios::trunc);
    if (!f.out.is_open()) {
      close();
      return Status::io_error("failed opening '" + f.path + "'");
    }
  }
  open_ = true;

  const std::string header = JsonLine()
                                 .str("type", "run_started")
                                 .time("t", run.start_time_ns)
                                 .time("t_wall", run.wall_start_time_ns)
                                 .str("service", run.service)
                                 .str("config_path", run.config_path)
                                 .str("config_hash", run.config_hash)
                                 .done();
  PL_RETURN_IF_ERROR(write_line_(header));
  return flush();
}

Status JsonlEventSink::emit(const Event& e) {
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit called while not open");

  JsonLine line;
  line.str("type", e.type).time("t", e.t_ns).time("t_wall", e.t_wall_ns);
  if (!e.session.empty()) line.str("session", e.session);
  if (e.frame_count) line.i64("frame_count", *e.frame_count);
  if (!e.message.empty()) line.str("message", e.message);

  return write_line_(line.done());
}

Status JsonlEventSink::write_line_(const std::string& line) {
  for (File& f : files_) {
    f.out << line << '\n';
    if (!f.out.good()) return Status::io_error("failed writing to '" + f.path + "'");
  }
  return Status::ok_status();
}

Status JsonlEventSink::flush() {
  if (!open_) return Status::ok_status();
  for (File& f : files_) {
    f.out.flush();
    if (!f.out.good()) return Status::io_error("failed flushing '" + f.path + "'");
  }
  return Status::ok_status();
}

void JsonlEventSink::close() {
  for (File& f : files_) {
    if (f.out.is_open()) f.out.close();
  }
  open_ = false;
}

}  // namespace pl
