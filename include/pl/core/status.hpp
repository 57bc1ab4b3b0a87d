// include/pl/core/status.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace pl {

// Error model shared by every module. Nothing below throws across a module API;
// library exceptions (yaml-cpp, std::filesystem) are converted where they are caught.
class Status {
 public:
  enum class Code : int {
    kOk = 0,

    // Bad input: config values, session names, malformed arguments.
    kInvalidArgument,
    kOutOfRange,

    // Local filesystem.
    kNotFound,
    kIoError,

    // Transient-remote: retried on the next tick.
    kTimeout,
    kUnavailable,

    // Local disk below the free-space margin; the frame is dropped.
    kResourceExhausted,

    // Printer responses and config documents.
    kParseError,
    kCorruptData,

    kUnsupported,
    kInternal,
  };

  Status() = default;  // OK
  Status(Code code, std::string message) : code_(code), message_(std::move(message)) {}

  [[nodiscard]] bool ok() const noexcept { return code_ == Code::kOk; }
  [[nodiscard]] Code code() const noexcept { return code_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  // True for failures worth retrying on the next poll rather than giving up on the unit.
  [[nodiscard]] bool is_transient() const noexcept {
    return code_ == Code::kTimeout || code_ == Code::kUnavailable;
  }

  static Status ok_status() { return Status(); }

  static Status invalid_argument(std::string msg) { return {Code::kInvalidArgument, std::move(msg)}; }
  static Status out_of_range(std::string msg) { return {Code::kOutOfRange, std::move(msg)}; }
  static Status not_found(std::string msg) { return {Code::kNotFound, std::move(msg)}; }
  static Status io_error(std::string msg) { return {Code::kIoError, std::move(msg)}; }
  static Status timeout(std::string msg) { return {Code::kTimeout, std::move(msg)}; }
  static Status unavailable(std::string msg) { return {Code::kUnavailable, std::move(msg)}; }
  static Status resource_exhausted(std::string msg) { return {Code::kResourceExhausted, std::move(msg)}; }
  static Status parse_error(std::string msg) { return {Code::kParseError, std::move(msg)}; }
  static Status corrupt_data(std::string msg) { return {Code::kCorruptData, std::move(msg)}; }
  static Status unsupported(std::string msg) { return {Code::kUnsupported, std::move(msg)}; }
  static Status internal(std::string msg) { return {Code::kInternal, std::move(msg)}; }

 private:
  Code code_ = Code::kOk;
  std::string message_;
};

// Value or error. Accessing the value of an error result throws std::bad_optional_access.
template <typename T>
class Result {
 public:
  Result() = delete;

  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(Status status) { return Result(std::move(status)); }

  [[nodiscard]] bool ok() const noexcept { return status_.ok(); }
  [[nodiscard]] const Status& status() const noexcept { return status_; }

  [[nodiscard]] const T& value() const { return value_.value(); }
  [[nodiscard]] T& value() { return value_.value(); }

  [[nodiscard]] const T& operator*() const { return value(); }
  [[nodiscard]] T& operator*() { return value(); }
  [[nodiscard]] const T* operator->() const { return &value(); }
  [[nodiscard]] T* operator->() { return &value(); }

  [[nodiscard]] T take_value() { return std::move(value_.value()); }

 private:
  explicit Result(T value) : value_(std::move(value)) {}
  explicit Result(Status status) : status_(std::move(status)) {}

  std::optional<T> value_;
  Status status_;
};

// Stable lowercase name ("timeout", "io_error", ...) for logs and events.
const char* status_code_name(Status::Code code);

#define PL_RETURN_IF_ERROR(expr)    \
  do {                              \
    const ::pl::Status _st = (expr); \
    if (!_st.ok()) return _st;      \
  } while (0)

}  // namespace pl
