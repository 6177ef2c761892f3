#ifndef FRAMESCOPE_TESTS_COMMON_TEMP_DIR_HPP_
#define FRAMESCOPE_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace framescope::tests::common {

// Scratch directory removed on scope exit.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) {
    static std::atomic<unsigned> counter{0U};
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    path_ = std::filesystem::temp_directory_path() /
            (std::string(prefix) + "-" + std::to_string(now_ms) + "-" +
             std::to_string(counter.fetch_add(1U)));

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
    if (ec) {
      Fail("failed to create temp root: " + path_.string());
    }
  }

  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

// Writes `content` byte-for-byte; no newline translation.
inline void WriteFixtureFile(const std::filesystem::path& path, std::string_view content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to create fixture file: " + path.string());
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out) {
    Fail("failed to write fixture file: " + path.string());
  }
}

} // namespace framescope::tests::common

#endif // FRAMESCOPE_TESTS_COMMON_TEMP_DIR_HPP_
