#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace framescope::frames {

// One row of integer counters. Column meaning comes from the owning table header.
using FrameRow = std::vector<std::int64_t>;

// One SurfaceFlinger latency record. Values are raw source ticks (nanoseconds on
// current devices); `frame_ready_time` orders frames within a session.
struct LatencyFrame {
  std::int64_t desired_present_time = 0;
  std::int64_t actual_present_time = 0;
  std::int64_t frame_ready_time = 0;
};

inline FrameRow ToRow(const LatencyFrame& frame) {
  return {frame.desired_present_time, frame.actual_present_time, frame.frame_ready_time};
}

inline std::vector<std::string> LatencyFrameFields() {
  return {"desired_present_time", "actual_present_time", "frame_ready_time"};
}

} // namespace framescope::frames
