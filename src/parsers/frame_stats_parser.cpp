#include "parsers/frame_stats_parser.hpp"

#include "core/text_utils.hpp"

#include <string>

namespace framescope::parsers {

namespace {

enum class BlockState {
  kSeekingMarker,
  kExpectHeader,
  kInBlock,
};

bool IsMarkerLine(std::string_view line) {
  return line.substr(0, kProfileDataMarker.size()) == kProfileDataMarker;
}

bool ParseRow(std::string_view line, frames::FrameRow& row) {
  row.clear();
  for (const auto field : SplitFrameStatsLine(line)) {
    std::int64_t value = 0;
    if (!core::ParseInt64(field, value)) {
      return false;
    }
    row.push_back(value);
  }
  return true;
}

} // namespace

std::vector<std::string_view> SplitFrameStatsLine(std::string_view line) {
  std::vector<std::string_view> fields = core::SplitCommas(line);
  fields.pop_back();
  return fields;
}

bool ExtractFrameStatsHeader(std::istream& input, std::vector<std::string>& columns) {
  columns.clear();
  std::string raw_line;
  while (core::ReadNormalizedLine(input, raw_line)) {
    if (!IsMarkerLine(core::TrimAscii(raw_line))) {
      continue;
    }
    if (!core::ReadNormalizedLine(input, raw_line)) {
      return false;
    }
    for (const auto field : SplitFrameStatsLine(core::TrimAscii(raw_line))) {
      columns.emplace_back(core::TrimAscii(field));
    }
    return true;
  }
  return false;
}

FrameStatsParser::FrameStatsParser(core::logging::Logger& logger) : logger_(logger) {}

std::string_view FrameStatsParser::name() const {
  return "gfxinfo_framestats";
}

void FrameStatsParser::Parse(std::istream& raw, frames::FrameTable& table, ParseStats& stats) {
  BlockState state = BlockState::kSeekingMarker;
  std::string raw_line;
  frames::FrameRow row;
  std::string error;

  while (core::ReadNormalizedLine(raw, raw_line)) {
    const std::string_view line = core::TrimAscii(raw_line);

    switch (state) {
    case BlockState::kSeekingMarker:
      if (IsMarkerLine(line)) {
        ++stats.blocks_seen;
        state = BlockState::kExpectHeader;
      }
      break;
    case BlockState::kExpectHeader:
      state = BlockState::kInBlock;
      break;
    case BlockState::kInBlock:
      if (IsMarkerLine(line)) {
        state = BlockState::kSeekingMarker;
        break;
      }
      if (line.empty()) {
        break;
      }
      if (!ParseRow(line, row)) {
        CountVerdict(RecordVerdict::kMalformed, stats);
        logger_.Warn("dropping malformed framestats row", {{"line", line}});
        break;
      }
      if (!table.Append(row, error)) {
        CountVerdict(RecordVerdict::kMalformed, stats);
        logger_.Warn("dropping framestats row with unexpected arity",
                     {{"line", line}, {"error", error}});
        break;
      }
      CountVerdict(RecordVerdict::kAccepted, stats);
      break;
    }
  }

  if (stats.blocks_seen == 0U) {
    logger_.Warn("could not find frames data in gfxinfo output");
  }
}

} // namespace framescope::parsers
