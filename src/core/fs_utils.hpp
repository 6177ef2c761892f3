#ifndef FRAMESCOPE_CORE_FS_UTILS_HPP_
#define FRAMESCOPE_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace framescope::core {

namespace detail {

inline std::string BuildUniqueSuffix() {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return std::to_string(tick) + "." + std::to_string(suffix);
}

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  return output_path.string() + ".tmp." + BuildUniqueSuffix();
}

} // namespace detail

// Returns a fresh, not-yet-existing path in the system temp directory.
// Two calls in the same process never return the same path.
inline std::filesystem::path BuildUniqueTempFilePath(std::string_view prefix) {
  std::error_code ec;
  std::filesystem::path temp_dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    temp_dir = ".";
  }
  return temp_dir / (std::string(prefix) + "-" + detail::BuildUniqueSuffix() + ".raw");
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

// Best-effort atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// On filesystems where rename-overwrite is restricted, we attempt a
// remove+rename fallback while still ensuring partially written output files are
// not published.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
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

// Copies `source` over `destination`, creating parent directories as needed.
inline bool CopyFileOverwrite(const std::filesystem::path& source,
                              const std::filesystem::path& destination, std::string& error) {
  if (!EnsureParentDirectory(destination, error)) {
    return false;
  }

  std::error_code ec;
  std::filesystem::copy_file(source, destination,
                             std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    error = "failed to copy '" + source.string() + "' to '" + destination.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace framescope::core

#endif // FRAMESCOPE_CORE_FS_UTILS_HPP_
