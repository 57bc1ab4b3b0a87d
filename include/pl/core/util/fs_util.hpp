// include/pl/core/util/fs_util.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "pl/core/status.hpp"

namespace pl {

// "~/x" -> "$HOME/x". Anything else is returned unchanged.
std::string expand_home(const std::string& path);

// Replace every non-alphanumeric character with '_'.
std::string sanitize_name(const std::string& raw);

// frame_000042.jpg
std::string frame_filename(int index, const std::string& ext);

// True for names shaped like frame_NNNNNN.<ext>.
bool is_frame_filename(const std::string& name, const std::string& ext);

// Frame files of a frames/ directory, sorted by name. Missing dir -> empty.
Result<std::vector<std::filesystem::path>> list_frames(const std::filesystem::path& frames_dir,
                                                       const std::string& ext);

// Free space available to unprivileged users, in MB.
Result<std::int64_t> free_space_mb(const std::filesystem::path& path);

// Create (or refresh the mtime of) an empty file.
Status touch_file(const std::filesystem::path& path);

// Copy via "<dst>.part" + rename so readers never see a truncated frame.
// The copy is verified by size before the rename.
Status copy_file_atomic(const std::filesystem::path& src, const std::filesystem::path& dst);

// Age of the file's mtime relative to now. Errors if the file cannot be stat'ed.
Result<std::chrono::seconds> file_age(const std::filesystem::path& path);

// Session directories directly under `root`, sorted by name. Missing root -> empty.
Result<std::vector<std::filesystem::path>> list_session_dirs(const std::filesystem::path& root);

}  // namespace pl
