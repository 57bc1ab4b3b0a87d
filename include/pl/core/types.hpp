// include/pl/core/types.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pl {

// -----------------------------
// Basic identifiers
// -----------------------------

using SessionName = std::string;  // e.g. "20250114_093000_benchy_gcode"
using JobId = std::int64_t;

// -----------------------------
// Time
// -----------------------------
// Integer nanoseconds. Steady-clock relative unless a field says `wall`.

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }
};

// -----------------------------
// Printer status (one per poll)
// -----------------------------

struct PrinterStatus {
  bool is_printing = false;
  // True through PRINTING / PAUSED / ATTENTION, false once the job reached a terminal state.
  bool is_job_active = false;
  std::optional<JobId> job_id;
  std::optional<std::string> job_name;
  std::optional<float> progress_percent;
  std::string state_text = "UNKNOWN";
};

// -----------------------------
// Sessions
// -----------------------------

enum class SessionMode {
  kNormal,
  kFinishing,
  kPostPrint,
};

enum class SessionOrigin {
  kAuto,
  kManual,
};

struct Session {
  SessionName name;
  std::optional<JobId> job_id;  // only tracked for kAuto
  int frame_count = 0;
  SessionMode mode = SessionMode::kNormal;
  SessionOrigin origin = SessionOrigin::kAuto;
};

const char* to_string(SessionMode mode);
const char* to_string(SessionOrigin origin);

// Where a frame ended up.
enum class StoreTier {
  kPrimary,
  kFallback,
};

const char* to_string(StoreTier tier);

}  // namespace pl
