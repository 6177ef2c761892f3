#include "parsers/latency_trace_parser.hpp"

#include "core/text_utils.hpp"
#include "frames/frame_types.hpp"

#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace framescope::parsers {

namespace {

struct LatencyParseState {
  FrameWatermark watermark;
  std::optional<std::int64_t> drop_threshold;
};

bool ParseTokens(const std::vector<std::string_view>& tokens, std::vector<std::int64_t>& values) {
  values.clear();
  values.reserve(tokens.size());
  for (const auto token : tokens) {
    std::int64_t value = 0;
    if (!core::ParseInt64(token, value)) {
      return false;
    }
    values.push_back(value);
  }
  return true;
}

// Saturates at the int64 limits instead of overflowing.
std::int64_t DropThresholdFor(const std::int64_t refresh_period) {
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
  if (refresh_period > kMax / kDropThresholdFactor) {
    return kMax;
  }
  if (refresh_period < kMin / kDropThresholdFactor) {
    return kMin;
  }
  return refresh_period * kDropThresholdFactor;
}

// ready - desired <= threshold, evaluated without signed overflow.
bool WithinDropThreshold(const frames::LatencyFrame& frame, const std::int64_t threshold) {
  const auto ready = static_cast<std::uint64_t>(frame.frame_ready_time);
  const auto desired = static_cast<std::uint64_t>(frame.desired_present_time);
  if (threshold >= 0) {
    if (frame.frame_ready_time <= frame.desired_present_time) {
      return true;
    }
    return ready - desired <= static_cast<std::uint64_t>(threshold);
  }

  if (frame.frame_ready_time >= frame.desired_present_time) {
    return false;
  }
  const std::uint64_t early_by = desired - ready;
  const std::uint64_t required = static_cast<std::uint64_t>(-(threshold + 1)) + 1U;
  return early_by >= required;
}

} // namespace

LatencyTraceParser::LatencyTraceParser(core::logging::Logger& logger) : logger_(logger) {}

std::string_view LatencyTraceParser::name() const {
  return "surfaceflinger_latency";
}

void LatencyTraceParser::Parse(std::istream& raw, frames::FrameTable& table, ParseStats& stats) {
  LatencyParseState state;
  std::string raw_line;
  std::vector<std::int64_t> values;
  std::string error;

  while (core::ReadNormalizedLine(raw, raw_line)) {
    const std::string_view line = core::TrimAscii(raw_line);
    if (line.empty()) {
      continue;
    }

    if (line.find(kSurfaceFlingerUnresponsiveMarker) != std::string_view::npos) {
      ++stats.unresponsive_count;
      continue;
    }

    const auto tokens = core::SplitWhitespace(line);
    const bool numeric = (tokens.size() == 1U || tokens.size() == 3U) && ParseTokens(tokens, values);
    if (!numeric) {
      ++stats.unexpected_lines;
      logger_.Warn("unexpected SurfaceFlinger dump output", {{"line", line}});
      continue;
    }

    if (values.size() == 1U) {
      const std::int64_t refresh_period = values.front();
      stats.refresh_period = refresh_period;
      ++stats.blocks_seen;
      state.drop_threshold = DropThresholdFor(refresh_period);
      continue;
    }

    const frames::LatencyFrame frame{
        .desired_present_time = values[0],
        .actual_present_time = values[1],
        .frame_ready_time = values[2],
    };

    const RecordVerdict verdict = ScreenRecord(
        frame, state.watermark,
        [](const frames::LatencyFrame& f) { return f.frame_ready_time; },
        [&state](const frames::LatencyFrame& f) {
          return state.drop_threshold.has_value() && WithinDropThreshold(f, *state.drop_threshold);
        });

    if (verdict == RecordVerdict::kImplausible) {
      logger_.Debug("dropping bogus frame", {{"line", line}});
    }
    if (verdict != RecordVerdict::kAccepted) {
      CountVerdict(verdict, stats);
      continue;
    }

    if (!table.Append(frames::ToRow(frame), error)) {
      CountVerdict(RecordVerdict::kMalformed, stats);
      logger_.Warn("latency frame does not match table header",
                   {{"line", line}, {"error", error}});
      continue;
    }
    CountVerdict(verdict, stats);
  }
}

} // namespace framescope::parsers
