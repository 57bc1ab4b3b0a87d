// include/pl/core/util/subprocess.hpp
#pragma once

#include <sys/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "pl/core/status.hpp"

namespace pl {

// How a child ended. Exactly one of exit_code / term_signal is set once finished.
struct ProcessResult {
  std::optional<int> exit_code;
  std::optional<int> term_signal;
  bool timed_out = false;
  std::string output;  // combined stdout+stderr when captured (bounded)

  [[nodiscard]] bool success() const { return !timed_out && exit_code && *exit_code == 0; }
  [[nodiscard]] bool killed_by_sigkill() const;
  std::string describe() const;
};

struct ProcessOptions {
  // Capture combined stdout/stderr into ProcessResult::output.
  bool capture_output = true;
  std::size_t max_output_bytes = 64 * 1024;

  // Redirect combined stdout/stderr to this file instead (ChildProcess only).
  std::string output_file;
};

// A spawned child (fork + execvp, no shell). Kills and reaps the child on destruction
// if it is still running.
class ChildProcess {
 public:
  ChildProcess() = default;
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;
  ChildProcess(ChildProcess&& other) noexcept;
  ChildProcess& operator=(ChildProcess&& other) noexcept;

  static Result<ChildProcess> spawn(const std::vector<std::string>& argv,
                                    const ProcessOptions& opts = {});

  // Non-blocking. Returns the result once the child has exited.
  std::optional<ProcessResult> poll();

  // SIGKILL + reap. Result is marked timed_out when `timed_out` is set.
  ProcessResult kill(bool timed_out);

  // Block until exit or deadline; the child is killed at the deadline.
  ProcessResult wait_for(std::chrono::milliseconds timeout);

  [[nodiscard]] bool running() const { return pid_ > 0; }
  [[nodiscard]] pid_t pid() const { return pid_; }
  [[nodiscard]] std::chrono::steady_clock::duration elapsed() const;

 private:
  void drain_output();
  ProcessResult finish(int wait_status);

  pid_t pid_ = -1;
  int out_fd_ = -1;
  std::size_t max_output_bytes_ = 0;
  std::string output_;
  std::chrono::steady_clock::time_point started_{};
};

// Convenience: spawn, wait with deadline, return how it ended.
Result<ProcessResult> run_process(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout,
                                  const ProcessOptions& opts = {});

// For logs only: argv joined with spaces.
std::string join_argv(const std::vector<std::string>& argv);

}  // namespace pl
