#include "parsers/last_dump_extractor.hpp"

#include "common/temp_dir.hpp"

#include <catch2/catch.hpp>

#include <string>

namespace {

using framescope::parsers::ExtractLastGfxinfoDump;
using framescope::parsers::LastDumpExtraction;
using framescope::tests::common::ScopedTempDir;
using framescope::tests::common::WriteFixtureFile;

std::string BuildDump(const std::string& pid, const std::string& rows) {
  return "\n** Graphics info for pid " + pid + " [com.example.app] **\n\n"
         "Stats since: 1234ns\n"
         "Total frames rendered: 42\n"
         "---PROFILEDATA---\n"
         "Flags,IntendedVsync,Vsync,\n" +
         rows + "---PROFILEDATA---\n\nView hierarchy:\n  com.example.app/MainActivity\r\n";
}

} // namespace

TEST_CASE("Last dump extraction returns only the final dump byte-for-byte",
          "[parsers][last_dump]") {
  ScopedTempDir temp("framescope-last-dump");
  const auto raw = temp.path() / "capture.raw";
  const std::string first = BuildDump("100", "0,1,2,\n0,3,4,\n");
  const std::string second = BuildDump("100", "0,3,4,\r\n0,5,6,\r\n0,7,8,\r\n");
  WriteFixtureFile(raw, first + second);

  LastDumpExtraction extraction;
  std::string error;
  REQUIRE(ExtractLastGfxinfoDump(raw, extraction, error));
  REQUIRE(extraction.dump.has_value());
  REQUIRE_FALSE(extraction.corrupted);
  REQUIRE(*extraction.dump == second.substr(1));
}

TEST_CASE("Last dump extraction works when the dump spans many chunks",
          "[parsers][last_dump]") {
  ScopedTempDir temp("framescope-last-dump");
  const auto raw = temp.path() / "capture.raw";
  std::string rows;
  for (int i = 0; i < 40; ++i) {
    rows += "0," + std::to_string(i * 10) + "," + std::to_string(i * 10 + 5) + ",\n";
  }
  const std::string first = BuildDump("7", "0,1,2,\n");
  const std::string second = BuildDump("8", rows);
  WriteFixtureFile(raw, first + second);

  LastDumpExtraction extraction;
  std::string error;
  REQUIRE(ExtractLastGfxinfoDump(raw, extraction, error, 64U));
  REQUIRE(extraction.dump.has_value());
  REQUIRE(*extraction.dump == second.substr(1));
}

TEST_CASE("Last dump extraction reports no dump for a file without markers",
          "[parsers][last_dump]") {
  ScopedTempDir temp("framescope-last-dump");
  const auto raw = temp.path() / "capture.raw";
  WriteFixtureFile(raw, "No process found for: com.example.app\n");

  LastDumpExtraction extraction;
  std::string error;
  REQUIRE(ExtractLastGfxinfoDump(raw, extraction, error));
  REQUIRE_FALSE(extraction.dump.has_value());
  REQUIRE_FALSE(extraction.corrupted);
}

TEST_CASE("Last dump extraction flags a header end without a dump start",
          "[parsers][last_dump]") {
  ScopedTempDir temp("framescope-last-dump");
  const auto raw = temp.path() / "capture.raw";
  WriteFixtureFile(raw, "truncated info for pid 9 [com.example.app] **\n---PROFILEDATA---\n");

  LastDumpExtraction extraction;
  std::string error;
  REQUIRE_FALSE(ExtractLastGfxinfoDump(raw, extraction, error));
  REQUIRE(extraction.corrupted);
  REQUIRE(error.find("appears to be corrupted") != std::string::npos);
  REQUIRE(error.find(raw.string()) != std::string::npos);
}

TEST_CASE("Last dump extraction fails on a missing file", "[parsers][last_dump]") {
  ScopedTempDir temp("framescope-last-dump");

  LastDumpExtraction extraction;
  std::string error;
  REQUIRE_FALSE(ExtractLastGfxinfoDump(temp.path() / "missing.raw", extraction, error));
  REQUIRE_FALSE(extraction.corrupted);
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("Reverse chunk reader walks the file tail first", "[parsers][last_dump]") {
  ScopedTempDir temp("framescope-last-dump");
  const auto raw = temp.path() / "digits.txt";
  WriteFixtureFile(raw, "0123456789");

  framescope::parsers::ReverseChunkReader reader(4U);
  std::string error;
  REQUIRE(reader.Open(raw, error));

  std::string chunk;
  REQUIRE(reader.NextChunkFromEnd(chunk, error));
  REQUIRE(chunk == "6789");
  REQUIRE(reader.NextChunkFromEnd(chunk, error));
  REQUIRE(chunk == "2345");
  REQUIRE(reader.NextChunkFromEnd(chunk, error));
  REQUIRE(chunk == "01");
  REQUIRE_FALSE(reader.HasMore());
}
