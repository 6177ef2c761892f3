#pragma once

#include "frames/frame_table.hpp"
#include "parsers/record_filter.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string_view>

namespace framescope::parsers {

// Per-parse tallies. Rejections are counted here and never fail a parse.
struct ParseStats {
  std::uint64_t frames_accepted = 0U;
  std::uint64_t null_frames = 0U;
  std::uint64_t stale_frames = 0U;
  std::uint64_t bogus_frames = 0U;
  std::uint64_t malformed_records = 0U;
  std::uint64_t unexpected_lines = 0U;
  std::uint64_t unresponsive_count = 0U;
  // Number of frame-data blocks (stats) or refresh-period markers (latency) seen.
  std::uint64_t blocks_seen = 0U;
  std::optional<std::int64_t> refresh_period;
};

void CountVerdict(RecordVerdict verdict, ParseStats& stats);

// Turns one session's raw capture text into frame rows.
//
// Parsers never fail on bad records: they log, count, and skip. The table's
// header must already be set by the caller; rows are appended in input order.
class IDumpParser {
public:
  virtual ~IDumpParser() = default;

  virtual std::string_view name() const = 0;

  virtual void Parse(std::istream& raw, frames::FrameTable& table, ParseStats& stats) = 0;
};

} // namespace framescope::parsers
