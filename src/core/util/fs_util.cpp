// src/core/util/fs_util.cpp
#include "pl/core/util/fs_util.hpp"

#include <sys/statvfs.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace pl {
namespace fs = std::filesystem;

namespace {

constexpr const char* kFramePrefix = "frame_";
constexpr std::size_t kFrameDigits = 6;

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

}  // namespace

std::string expand_home(const std::string& path) {
  if (path != "~" && path.rfind("~/", 0) != 0) return path;
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') return path;
  return std::string(home) + path.substr(1);
}

std::string sanitize_name(const std::string& raw) {
  std::string out = raw;
  for (char& c : out) {
    if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
  }
  return out;
}

std::string frame_filename(int index, const std::string& ext) {
  std::ostringstream ss;
  ss << kFramePrefix << std::setfill('0') << std::setw(static_cast<int>(kFrameDigits)) << index
     << "." << ext;
  return ss.str();
}

bool is_frame_filename(const std::string& name, const std::string& ext) {
  const std::string prefix = kFramePrefix;
  const std::string suffix = "." + ext;
  if (name.rfind(prefix, 0) != 0) return false;
  if (name.size() <= prefix.size() + suffix.size()) return false;
  if (name.substr(name.size() - suffix.size()) != suffix) return false;
  return is_digits(name.substr(prefix.size(), name.size() - prefix.size() - suffix.size()));
}

Result<std::vector<fs::path>> list_frames(const fs::path& frames_dir, const std::string& ext) {
  using R = Result<std::vector<fs::path>>;

  std::error_code ec;
  std::vector<fs::path> out;
  if (!fs::exists(frames_dir, ec)) {
    if (ec) return R::err(Status::io_error("stat failed for " + frames_dir.string() + ": " + ec.message()));
    return R::ok(std::move(out));
  }

  for (const auto& it : fs::directory_iterator(frames_dir, ec)) {
    if (!it.is_regular_file(ec)) continue;
    const std::string name = it.path().filename().string();
    if (is_frame_filename(name, ext)) out.push_back(it.path());
  }
  if (ec) return R::err(Status::io_error("failed listing " + frames_dir.string() + ": " + ec.message()));

  std::sort(out.begin(), out.end(),
            [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
  return R::ok(std::move(out));
}

Result<std::int64_t> free_space_mb(const fs::path& path) {
  struct statvfs st {};
  if (::statvfs(path.c_str(), &st) != 0) {
    return Result<std::int64_t>::err(Status::io_error("statvfs failed for " + path.string()));
  }
  const auto bytes = static_cast<std::uint64_t>(st.f_bavail) * static_cast<std::uint64_t>(st.f_frsize);
  return Result<std::int64_t>::ok(static_cast<std::int64_t>(bytes / (1024ull * 1024ull)));
}

Status touch_file(const fs::path& path) {
  {
    std::ofstream f(path, std::ios::out | std::ios::app);
    if (!f.is_open()) return Status::io_error("failed creating " + path.string());
  }
  std::error_code ec;
  fs::last_write_time(path, fs::file_time_type::clock::now(), ec);
  if (ec) return Status::io_error("failed touching " + path.string() + ": " + ec.message());
  return Status::ok_status();
}

Status copy_file_atomic(const fs::path& src, const fs::path& dst) {
  std::error_code ec;
  const auto src_size = fs::file_size(src, ec);
  if (ec) return Status::io_error("cannot stat source " + src.string() + ": " + ec.message());

  fs::path tmp = dst;
  tmp += ".part";

  fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return Status::io_error("copy to " + tmp.string() + " failed: " + ec.message());
  }

  const auto dst_size = fs::file_size(tmp, ec);
  if (ec || dst_size != src_size) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return Status::corrupt_data("size mismatch after copy to " + dst.string());
  }

  fs::rename(tmp, dst, ec);
  if (ec) return Status::io_error("rename to " + dst.string() + " failed: " + ec.message());
  return Status::ok_status();
}

Result<std::chrono::seconds> file_age(const fs::path& path) {
  std::error_code ec;
  const auto mtime = fs::last_write_time(path, ec);
  if (ec) {
    return Result<std::chrono::seconds>::err(
        Status::io_error("cannot stat " + path.string() + ": " + ec.message()));
  }
  const auto age = fs::file_time_type::clock::now() - mtime;
  return Result<std::chrono::seconds>::ok(std::chrono::duration_cast<std::chrono::seconds>(age));
}

Result<std::vector<fs::path>> list_session_dirs(const fs::path& root) {
  using R = Result<std::vector<fs::path>>;

  std::error_code ec;
  std::vector<fs::path> out;
  if (!fs::exists(root, ec)) {
    if (ec) return R::err(Status::io_error("stat failed for " + root.string() + ": " + ec.message()));
    return R::ok(std::move(out));
  }

  for (const auto& it : fs::directory_iterator(root, ec)) {
    if (!it.is_directory(ec)) continue;
    const std::string name = it.path().filename().string();
    if (name.empty() || name[0] == '.') continue;
    out.push_back(it.path());
  }
  if (ec) return R::err(Status::io_error("failed listing " + root.string() + ": " + ec.message()));

  std::sort(out.begin(), out.end());
  return R::ok(std::move(out));
}

}  // namespace pl
