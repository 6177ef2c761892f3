#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace framescope::collectors {

// Append-only file receiving raw capture text for one collection session.
//
// Owned by the collector worker while a session runs; every Append() is flushed
// so an interrupted session still leaves all completed samples on disk.
class RawSampleSink {
public:
  RawSampleSink() = default;
  RawSampleSink(RawSampleSink&&) = default;
  RawSampleSink& operator=(RawSampleSink&&) = default;
  RawSampleSink(const RawSampleSink&) = delete;
  RawSampleSink& operator=(const RawSampleSink&) = delete;

  // Creates (or truncates) `path` and opens it for appending.
  bool Open(const std::filesystem::path& path, std::string& error);

  bool Append(std::string_view text, std::string& error);

  void Close();

  const std::filesystem::path& path() const;
  std::uint64_t bytes_written() const;

private:
  std::filesystem::path path_;
  std::ofstream out_;
  std::uint64_t bytes_written_ = 0U;
};

} // namespace framescope::collectors
