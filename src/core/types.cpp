// src/core/types.cpp
#include "pl/core/status.hpp"
#include "pl/core/types.hpp"

namespace pl {

const char* status_code_name(Status::Code code) {
  switch (code) {
    case Status::Code::kOk: return "ok";
    case Status::Code::kInvalidArgument: return "invalid_argument";
    case Status::Code::kOutOfRange: return "out_of_range";
    case Status::Code::kNotFound: return "not_found";
    case Status::Code::kIoError: return "io_error";
    case Status::Code::kTimeout: return "timeout";
    case Status::Code::kUnavailable: return "unavailable";
    case Status::Code::kResourceExhausted: return "resource_exhausted";
    case Status::Code::kParseError: return "parse_error";
    case Status::Code::kCorruptData: return "corrupt_data";
    case Status::Code::kUnsupported: return "unsupported";
    case Status::Code::kInternal: return "internal";
  }
  return "unknown";
}

const char* to_string(SessionMode mode) {
  switch (mode) {
    case SessionMode::kNormal: return "normal";
    case SessionMode::kFinishing: return "finishing";
    case SessionMode::kPostPrint: return "post_print";
  }
  return "unknown";
}

const char* to_string(SessionOrigin origin) {
  return origin == SessionOrigin::kManual ? "manual" : "auto";
}

const char* to_string(StoreTier tier) {
  return tier == StoreTier::kPrimary ? "primary" : "fallback";
}

}  // namespace pl
