// src/core/util/subprocess.cpp
#include "pl/core/util/subprocess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

namespace pl {
namespace {

constexpr auto kPollStep = std::chrono::milliseconds(50);

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Child side only: async-signal-safe calls until exec (argv is built before fork).
[[noreturn]] void exec_child(char* const* args, int out_fd) {
  const int devnull = ::open("/dev/null", O_RDWR);
  if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
  const int target = out_fd >= 0 ? out_fd : devnull;
  if (target >= 0) {
    ::dup2(target, STDOUT_FILENO);
    ::dup2(target, STDERR_FILENO);
  }

  ::execvp(args[0], args);
  _exit(127);
}

}  // namespace

bool ProcessResult::killed_by_sigkill() const { return term_signal && *term_signal == SIGKILL; }

std::string ProcessResult::describe() const {
  if (timed_out) return "timed out";
  if (exit_code) {
    if (*exit_code == 127) return "exit code 127 (command not found?)";
    return "exit code " + std::to_string(*exit_code);
  }
  if (term_signal) {
    return "killed by signal " + std::to_string(*term_signal) + " (" + ::strsignal(*term_signal) + ")";
  }
  return "still running";
}

ChildProcess::~ChildProcess() {
  if (running()) (void)kill(false);
  close_fd(out_fd_);
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      out_fd_(std::exchange(other.out_fd_, -1)),
      max_output_bytes_(other.max_output_bytes_),
      output_(std::move(other.output_)),
      started_(other.started_) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    if (running()) (void)kill(false);
    close_fd(out_fd_);
    pid_ = std::exchange(other.pid_, -1);
    out_fd_ = std::exchange(other.out_fd_, -1);
    max_output_bytes_ = other.max_output_bytes_;
    output_ = std::move(other.output_);
    started_ = other.started_;
  }
  return *this;
}

Result<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv,
                                         const ProcessOptions& opts) {
  if (argv.empty() || argv[0].empty()) {
    return Result<ChildProcess>::err(Status::invalid_argument("spawn: empty argv"));
  }

  int pipe_fds[2] = {-1, -1};
  int child_out = -1;

  if (!opts.output_file.empty()) {
    child_out = ::open(opts.output_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (child_out < 0) {
      return Result<ChildProcess>::err(
          Status::io_error("spawn: cannot open " + opts.output_file + ": " + std::strerror(errno)));
    }
  } else if (opts.capture_output) {
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
      return Result<ChildProcess>::err(Status::io_error(std::string("spawn: pipe failed: ") + std::strerror(errno)));
    }
    child_out = pipe_fds[1];
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    close_fd(pipe_fds[0]);
    close_fd(child_out);
    return Result<ChildProcess>::err(Status::internal(std::string("spawn: fork failed: ") + std::strerror(err)));
  }
  if (pid == 0) exec_child(args.data(), child_out);

  close_fd(child_out);

  ChildProcess child;
  child.pid_ = pid;
  child.out_fd_ = pipe_fds[0];
  child.max_output_bytes_ = opts.max_output_bytes;
  child.started_ = std::chrono::steady_clock::now();
  if (child.out_fd_ >= 0) {
    const int flags = ::fcntl(child.out_fd_, F_GETFL, 0);
    ::fcntl(child.out_fd_, F_SETFL, flags | O_NONBLOCK);
  }
  return Result<ChildProcess>::ok(std::move(child));
}

void ChildProcess::drain_output() {
  if (out_fd_ < 0) return;
  char buf[4096];
  while (true) {
    const ssize_t n = ::read(out_fd_, buf, sizeof(buf));
    if (n > 0) {
      const std::size_t room = max_output_bytes_ > output_.size() ? max_output_bytes_ - output_.size() : 0;
      output_.append(buf, std::min(room, static_cast<std::size_t>(n)));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;  // EOF, EAGAIN or a real error: nothing more to read right now
  }
}

ProcessResult ChildProcess::finish(int wait_status) {
  drain_output();
  close_fd(out_fd_);

  ProcessResult r;
  if (WIFEXITED(wait_status)) r.exit_code = WEXITSTATUS(wait_status);
  else if (WIFSIGNALED(wait_status)) r.term_signal = WTERMSIG(wait_status);
  r.output = std::move(output_);
  output_.clear();
  pid_ = -1;
  return r;
}

std::optional<ProcessResult> ChildProcess::poll() {
  if (!running()) return std::nullopt;
  drain_output();

  int status = 0;
  const pid_t w = ::waitpid(pid_, &status, WNOHANG);
  if (w == 0) return std::nullopt;
  if (w < 0) {
    // Reaped elsewhere or not our child any more.
    ProcessResult r;
    r.output = std::move(output_);
    pid_ = -1;
    close_fd(out_fd_);
    return r;
  }
  return finish(status);
}

ProcessResult ChildProcess::kill(bool timed_out) {
  ProcessResult r;
  if (running()) {
    ::kill(pid_, SIGKILL);
    int status = 0;
    pid_t w;
    do {
      w = ::waitpid(pid_, &status, 0);
    } while (w < 0 && errno == EINTR);
    r = finish(status);
  }
  r.timed_out = timed_out;
  return r;
}

ProcessResult ChildProcess::wait_for(std::chrono::milliseconds timeout) {
  const auto deadline = started_ + timeout;
  while (true) {
    if (auto done = poll()) return *done;
    if (std::chrono::steady_clock::now() >= deadline) return kill(true);
    std::this_thread::sleep_for(kPollStep);
  }
}

std::chrono::steady_clock::duration ChildProcess::elapsed() const {
  return std::chrono::steady_clock::now() - started_;
}

Result<ProcessResult> run_process(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout,
                                  const ProcessOptions& opts) {
  auto child_r = ChildProcess::spawn(argv, opts);
  if (!child_r.ok()) return Result<ProcessResult>::err(child_r.status());
  ChildProcess child = child_r.take_value();
  return Result<ProcessResult>::ok(child.wait_for(timeout));
}

std::string join_argv(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out += ' ';
    out += a;
  }
  return out;
}

}  // namespace pl
