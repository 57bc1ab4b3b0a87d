// File: src/core/session/control_file.cpp
#include "pl/core/session/control_file.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace pl {
namespace {

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

}  // namespace

std::optional<SessionName> ControlFile::read() const {
  std::ifstream in(path_);
  if (!in.is_open()) return std::nullopt;

  std::ostringstream ss;
  ss << in.rdbuf();
  std::string name = trim(ss.str());
  if (name.empty()) return std::nullopt;
  return name;
}

Status ControlFile::start(const SessionName& name) {
  const std::string trimmed = trim(name);
  if (trimmed.empty()) return Status::invalid_argument("session name must not be empty");

  std::error_code ec;
  if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);

  std::ofstream out(path_, std::ios::out | std::ios::trunc);
  if (!out.is_open()) return Status::io_error("failed opening control file '" + path_.string() + "'");
  out << trimmed << "\n";
  out.flush();
  if (!out.good()) return Status::io_error("failed writing control file '" + path_.string() + "'");
  return Status::ok_status();
}

Result<std::optional<SessionName>> ControlFile::stop() {
  std::optional<SessionName> was = read();

  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    return Result<std::optional<SessionName>>::err(
        Status::io_error("failed removing control file '" + path_.string() + "': " + ec.message()));
  }
  return Result<std::optional<SessionName>>::ok(std::move(was));
}

}  // namespace pl
