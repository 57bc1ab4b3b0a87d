// include/pl/core/util/deadline.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "pl/core/status.hpp"

namespace pl {
namespace detail {

// Worker body shared by the deadline helpers. `on_exit` runs on the worker right before
// the result is published, whether or not the caller is still waiting.
template <typename Fn, typename OnExit>
Status run_on_watchdog(Fn fn, OnExit on_exit, std::chrono::milliseconds timeout,
                       const std::string& what) {
  auto promise = std::make_shared<std::promise<Status>>();
  std::future<Status> fut = promise->get_future();

  std::thread worker([promise, fn = std::move(fn), on_exit = std::move(on_exit)]() mutable {
    Status st;
    try {
      st = fn();
    } catch (const std::exception& e) {
      st = Status::internal(e.what());
    }
    on_exit();
    promise->set_value(std::move(st));
  });
  worker.detach();

  if (fut.wait_for(timeout) == std::future_status::timeout) {
    return Status::timeout(what + " timed out after " + std::to_string(timeout.count()) + "ms");
  }
  return fut.get();
}

}  // namespace detail

// Runs `fn` (returning Status) on a watchdog worker and waits at most `timeout`.
//
// A blocked syscall on a hung network mount cannot be interrupted, so on timeout the
// worker is detached and left to finish (or hang) on its own. `fn` must therefore own
// everything it touches: capture by value only.
template <typename Fn>
Status run_with_deadline(Fn fn, std::chrono::milliseconds timeout, const std::string& what) {
  return detail::run_on_watchdog(std::move(fn), []() {}, timeout, what);
}

template <typename Fn>
Status run_with_deadline(Fn fn, std::chrono::seconds timeout, const std::string& what) {
  return run_with_deadline(std::move(fn), std::chrono::milliseconds(timeout), what);
}

// run_with_deadline with at most one worker alive at a time. While a timed-out worker is
// still blocked, run() fails fast with `unavailable` instead of starting another one.
class SingleFlight {
 public:
  SingleFlight() = default;
  SingleFlight(const SingleFlight&) = delete;
  SingleFlight& operator=(const SingleFlight&) = delete;

  template <typename Fn>
  Status run(Fn fn, std::chrono::milliseconds timeout, const std::string& what) {
    if (busy_->exchange(true)) {
      return Status::unavailable(what + " skipped: previous attempt still blocked");
    }
    ++started_;
    std::shared_ptr<std::atomic<bool>> busy = busy_;
    return detail::run_on_watchdog(std::move(fn), [busy]() { busy->store(false); }, timeout, what);
  }

  template <typename Fn>
  Status run(Fn fn, std::chrono::seconds timeout, const std::string& what) {
    return run(std::move(fn), std::chrono::milliseconds(timeout), what);
  }

  // Forget a stuck worker (e.g. one blocked on a mount that has since been replaced).
  // The next run() starts a fresh worker. Returns true when a worker was abandoned.
  bool abandon() {
    if (!busy_->load()) return false;
    busy_ = std::make_shared<std::atomic<bool>>(false);
    return true;
  }

  [[nodiscard]] bool in_flight() const { return busy_->load(); }
  [[nodiscard]] int workers_started() const { return started_; }

 private:
  std::shared_ptr<std::atomic<bool>> busy_ = std::make_shared<std::atomic<bool>>(false);
  int started_ = 0;
};

}  // namespace pl
