// File: src/core/util/shutdown.cpp
#include "pl/core/util/shutdown.hpp"

#include <signal.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace pl {
namespace {

std::atomic<bool> g_stop{false};

extern "C" void on_stop_signal(int) { g_stop.store(true); }

}  // namespace

void install_stop_handlers() {
  struct sigaction sa {};
  sa.sa_handler = &on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

bool stop_requested() { return g_stop.load(); }

void request_stop() { g_stop.store(true); }

bool sleep_unless_stopped(double seconds) {
  using clock = std::chrono::steady_clock;
  const auto deadline =
      clock::now() + std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(seconds));

  while (!stop_requested()) {
    const auto now = clock::now();
    if (now >= deadline) return true;
    std::this_thread::sleep_for(std::min<clock::duration>(deadline - now, std::chrono::milliseconds(250)));
  }
  return false;
}

}  // namespace pl
