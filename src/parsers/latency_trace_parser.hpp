#pragma once

#include "core/logging/logger.hpp"
#include "parsers/dump_parser.hpp"

#include <cstdint>
#include <string_view>

namespace framescope::parsers {

// Line SurfaceFlinger prints when it dumps without taking its state lock.
inline constexpr std::string_view kSurfaceFlingerUnresponsiveMarker =
    "SurfaceFlinger appears to be unresponsive, dumping anyways";

// A frame whose ready time trails its desired present time by more than
// refresh_period * kDropThresholdFactor is treated as corrupt.
inline constexpr std::int64_t kDropThresholdFactor = 1000;

// Parser for concatenated `dumpsys SurfaceFlinger --latency` output.
//
// Line grammar (after line-ending normalization and trimming):
//   <refresh_period>                     sets the drop threshold
//   <desired> <actual> <ready>           candidate frame
//   <unresponsive marker>                counted, otherwise ignored
// Anything else is logged as unexpected and skipped.
//
// Frame acceptance uses one watermark for the whole parse: a frame is kept only
// if ready != 0, ready is past every previously kept ready time, and
// ready - desired <= drop threshold. Frames seen before the first refresh
// period line have no threshold and are dropped as bogus.
class LatencyTraceParser final : public IDumpParser {
public:
  explicit LatencyTraceParser(core::logging::Logger& logger);

  std::string_view name() const override;

  void Parse(std::istream& raw, frames::FrameTable& table, ParseStats& stats) override;

private:
  core::logging::Logger& logger_;
};

} // namespace framescope::parsers
