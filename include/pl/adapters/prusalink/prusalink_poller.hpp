// File: include/pl/adapters/prusalink/prusalink_poller.hpp
#pragma once

#include <optional>
#include <string>

#include "pl/core/config.hpp"
#include "pl/core/io/status_poller.hpp"

namespace pl {

// Normalize a /api/v1/status body. Job state wins; printer.state is the fallback.
// PRINTING / PAUSED / ATTENTION keep the job active; FINISHED / STOPPED / ERROR end it.
Result<PrinterStatus> parse_status_body(const std::string& body);

// file.display_name (or file.name) from a /api/v1/job body. nullopt when absent.
std::optional<std::string> parse_job_name(const std::string& body);

// Printer status from the local PrusaLink HTTP API (X-Api-Key auth).
class PrusaLinkPoller final : public IStatusPoller {
 public:
  explicit PrusaLinkPoller(PrinterConfig cfg);

  Result<PrinterStatus> poll() override;

  std::string name() const override { return "prusalink"; }

  std::string status_url() const;
  std::string job_url() const;

 private:
  Result<std::string> get(const std::string& url) const;

  PrinterConfig cfg_;

  // The status body carries the job id but not always its name; look it up once per job.
  std::optional<JobId> named_job_;
  std::optional<std::string> job_name_;
};

}  // namespace pl
