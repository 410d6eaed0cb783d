#ifndef MODFORGE_CORE_FS_UTILS_HPP_
#define MODFORGE_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace modforge::core {

namespace detail {

inline std::filesystem::path BuildTempSiblingPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool RegularFileExists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && !ec;
}

inline bool DirectoryExists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec) && !ec;
}

inline std::filesystem::path AbsolutePath(const std::filesystem::path& path) {
  std::error_code ec;
  const std::filesystem::path absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  return absolute.lexically_normal();
}

// True when `path` is `dir` itself or lies underneath it. Both are compared as
// absolute, lexically normalized paths.
inline bool PathIsWithin(const std::filesystem::path& path, const std::filesystem::path& dir) {
  const std::filesystem::path normal_path = AbsolutePath(path);
  const std::filesystem::path normal_dir = AbsolutePath(dir);
  auto path_it = normal_path.begin();
  for (const auto& part : normal_dir) {
    if (part.empty()) {
      continue; // trailing separator
    }
    if (path_it == normal_path.end() || *path_it != part) {
      return false;
    }
    ++path_it;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Removes `dir` recursively when it exists. A missing directory is not an error.
inline bool RemoveDirectoryTree(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  const bool present = std::filesystem::exists(dir, ec);
  if (ec) {
    error = "failed to inspect '" + dir.string() + "': " + ec.message();
    return false;
  }
  if (!present) {
    return true;
  }

  std::filesystem::remove_all(dir, ec);
  if (ec) {
    error = "failed to delete '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Force-clears `dir` and recreates it empty so no residue of an earlier run
// can be mistaken for output of this one.
inline bool ResetDirectory(const std::filesystem::path& dir, std::string& error) {
  if (!RemoveDirectoryTree(dir, error)) {
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Best-effort atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// A failed rename removes the destination and retries once, so a partially
// written file is never published under the final name.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildTempSiblingPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    out_file.flush();
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace modforge::core

#endif // MODFORGE_CORE_FS_UTILS_HPP_
