// File: include/pl/core/util/shutdown.hpp
#pragma once

namespace pl {

// SIGINT / SIGTERM set a process-wide stop flag.
void install_stop_handlers();

bool stop_requested();

// For tests and for callers that stop on their own.
void request_stop();

// Sleeps in short steps; returns early (false) once a stop is requested.
bool sleep_unless_stopped(double seconds);

}  // namespace pl
