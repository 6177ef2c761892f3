#include "parsers/last_dump_extractor.hpp"

#include <algorithm>
#include <system_error>

namespace framescope::parsers {

namespace {

// Searches `chunk` plus the first few bytes of `tail` so a marker split across
// the chunk boundary is still found. Returns an offset into `chunk`.
std::size_t FindLastInWindow(const std::string& chunk, const std::string& tail,
                             std::string_view marker) {
  std::string window = chunk;
  window.append(tail, 0, std::min(tail.size(), marker.size() - 1));
  const std::size_t ix = window.rfind(marker);
  if (ix == std::string::npos || ix >= chunk.size()) {
    return std::string::npos;
  }
  return ix;
}

} // namespace

ReverseChunkReader::ReverseChunkReader(const std::size_t chunk_size)
    : chunk_size_(std::max<std::size_t>(chunk_size, 1U)) {}

bool ReverseChunkReader::Open(const std::filesystem::path& path, std::string& error) {
  std::error_code ec;
  const std::uintmax_t file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    error = "failed to stat '" + path.string() + "': " + ec.message();
    return false;
  }

  input_.open(path, std::ios::binary);
  if (!input_) {
    error = "failed to open '" + path.string() + "' for reading";
    return false;
  }
  remaining_ = static_cast<std::uint64_t>(file_size);
  return true;
}

bool ReverseChunkReader::HasMore() const {
  return remaining_ > 0U;
}

bool ReverseChunkReader::NextChunkFromEnd(std::string& chunk, std::string& error) {
  chunk.clear();
  if (remaining_ == 0U) {
    return true;
  }

  const std::uint64_t read_size = std::min<std::uint64_t>(remaining_, chunk_size_);
  const std::uint64_t offset = remaining_ - read_size;

  input_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  chunk.resize(static_cast<std::size_t>(read_size));
  input_.read(chunk.data(), static_cast<std::streamsize>(read_size));
  if (!input_ || static_cast<std::uint64_t>(input_.gcount()) != read_size) {
    error = "short read at offset " + std::to_string(offset);
    chunk.clear();
    return false;
  }

  remaining_ = offset;
  return true;
}

bool ExtractLastGfxinfoDump(const std::filesystem::path& path, LastDumpExtraction& extraction,
                            std::string& error, const std::size_t chunk_size) {
  extraction = LastDumpExtraction{};

  ReverseChunkReader reader(chunk_size);
  if (!reader.Open(path, error)) {
    return false;
  }

  std::string record;
  std::string chunk;
  while (reader.HasMore()) {
    if (!reader.NextChunkFromEnd(chunk, error)) {
      error = "failed to read '" + path.string() + "': " + error;
      return false;
    }

    std::size_t ix = FindLastInWindow(chunk, record, kGraphicsDumpStartMarker);
    if (ix != std::string::npos) {
      extraction.dump = chunk.substr(ix) + record;
      return true;
    }

    if (FindLastInWindow(chunk, record, kGraphicsDumpHeaderEnd) != std::string::npos) {
      std::string previous;
      if (!reader.NextChunkFromEnd(previous, error)) {
        error = "failed to read '" + path.string() + "': " + error;
        return false;
      }
      chunk = previous + chunk;
      ix = FindLastInWindow(chunk, record, kGraphicsDumpStartMarker);
      if (ix == std::string::npos) {
        extraction.corrupted = true;
        error = "\"" + path.string() + "\" appears to be corrupted";
        return false;
      }
      extraction.dump = chunk.substr(ix) + record;
      return true;
    }

    record = chunk + record;
  }

  return true;
}

} // namespace framescope::parsers
