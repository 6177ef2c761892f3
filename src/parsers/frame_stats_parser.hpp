#pragma once

#include "core/logging/logger.hpp"
#include "parsers/dump_parser.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace framescope::parsers {

// Delimits each framestats block in `dumpsys gfxinfo <pkg> framestats` output.
inline constexpr std::string_view kProfileDataMarker = "---PROFILEDATA---";

// Splits one comma-terminated framestats line and drops the final field (the
// source always ends lines with a trailing ',').
std::vector<std::string_view> SplitFrameStatsLine(std::string_view line);

// Reads up to the first profile-data marker and returns the following line as
// column names. Returns false when the stream holds no marker or no header line.
bool ExtractFrameStatsHeader(std::istream& input, std::vector<std::string>& columns);

// Parser for concatenated gfxinfo framestats dumps.
//
// Every block is: marker, header line (ignored, the session header is known up
// front), integer rows, closing marker. Rows are appended in file order.
// Overlapping ring-buffer content from consecutive ticks is NOT deduplicated.
class FrameStatsParser final : public IDumpParser {
public:
  explicit FrameStatsParser(core::logging::Logger& logger);

  std::string_view name() const override;

  void Parse(std::istream& raw, frames::FrameTable& table, ParseStats& stats) override;

private:
  core::logging::Logger& logger_;
};

} // namespace framescope::parsers
