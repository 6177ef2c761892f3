#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

namespace framescope::parsers {

// Start of one `dumpsys gfxinfo` dump ("** Graphics info for pid ... **").
inline constexpr std::string_view kGraphicsDumpStartMarker = "** Graphics";
// End of the dump header line; seeing it without the start marker means the
// start marker sits in the chunk just before.
inline constexpr std::string_view kGraphicsDumpHeaderEnd = " **\n";

inline constexpr std::size_t kDefaultReverseChunkSize = 1024U;

// Reads a file in fixed-size chunks from the end toward the beginning.
//
// Memory use is bounded by one chunk. The first chunk returned is the file's
// tail; the last one may be shorter than `chunk_size`.
class ReverseChunkReader {
public:
  explicit ReverseChunkReader(std::size_t chunk_size = kDefaultReverseChunkSize);

  bool Open(const std::filesystem::path& path, std::string& error);

  bool HasMore() const;

  // Reads the chunk immediately before the previously returned one.
  bool NextChunkFromEnd(std::string& chunk, std::string& error);

private:
  std::size_t chunk_size_;
  std::ifstream input_;
  std::uint64_t remaining_ = 0U;
};

struct LastDumpExtraction {
  // Empty when the file holds no dump start marker at all.
  std::optional<std::string> dump;
  // Set when a dump header end was found with no start marker right before it.
  bool corrupted = false;
};

// Recovers the last gfxinfo dump in a raw framestats capture file, from its
// "** Graphics" header to the end of the file, byte-for-byte.
//
// Returns false when the file cannot be read or is corrupted; a file without
// any dump is not an error.
bool ExtractLastGfxinfoDump(const std::filesystem::path& path, LastDumpExtraction& extraction,
                            std::string& error,
                            std::size_t chunk_size = kDefaultReverseChunkSize);

} // namespace framescope::parsers
