// File: include/pl/core/session/control_file.hpp
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "pl/core/status.hpp"
#include "pl/core/types.hpp"

namespace pl {

// Manual recording signal: a small file whose presence (and content) names the session.
class ControlFile {
 public:
  explicit ControlFile(std::filesystem::path path) : path_(std::move(path)) {}

  // Trimmed contents; nullopt when the file is missing, unreadable or blank.
  std::optional<SessionName> read() const;

  Status start(const SessionName& name);

  // Removes the file. Returns the name that was recording (nullopt if none).
  Result<std::optional<SessionName>> stop();

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace pl
