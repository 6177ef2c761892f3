#pragma once

#include "collectors/collector_factory.hpp"
#include "collectors/frame_collector.hpp"
#include "core/logging/logger.hpp"
#include "remote/remote_executor.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace framescope::instrument {

inline constexpr std::string_view kTimeUsChannelKind = "time_us";
inline constexpr std::string_view kFlagsChannelKind = "flags";

struct InstrumentChannel {
  std::string label;
  std::string kind;
  bool active = true;
};

// Result of one GetData() call: the exported CSV and what its columns mean.
struct MeasurementsCsv {
  std::filesystem::path path;
  std::vector<InstrumentChannel> channels;
  double sample_rate_hz = 0.0;
};

struct FramesInstrumentOptions {
  collectors::CollectorKind kind = collectors::CollectorKind::kSurfaceFlinger;
  // SurfaceFlinger view name or gfxinfo package name.
  std::string collector_target;
  std::chrono::milliseconds period{2000};
  // Keep the raw capture next to the exported CSV as `<outfile>.raw`.
  bool keep_raw = true;
};

// Builds the channel list for `kind`. gfxinfo channels come from the target's
// framestats columns; SurfaceFlinger channels are the latency fields without
// their "_time" suffix.
bool BuildFramesChannels(collectors::CollectorKind kind, remote::IRemoteExecutor& executor,
                         core::logging::Logger& logger, std::vector<InstrumentChannel>& channels,
                         std::string& error);

// Continuous frame instrument wrapping one FrameCollector per session.
//
// Typical use: Start() -> workload -> Stop() -> GetData(outfile). Start()
// builds a fresh collector whenever the previous session was stopped.
class FramesInstrument {
public:
  FramesInstrument(FramesInstrumentOptions options, remote::IRemoteExecutor& executor,
                   core::logging::Logger& logger, std::vector<InstrumentChannel> channels);

  static bool Create(FramesInstrumentOptions options, remote::IRemoteExecutor& executor,
                     core::logging::Logger& logger, std::unique_ptr<FramesInstrument>& instrument,
                     std::string& error);

  bool Reset(std::string& error);
  bool Start(std::string& error);
  bool Stop(std::string& error);

  bool GetData(const std::filesystem::path& outfile, MeasurementsCsv& measurements,
               std::string& error);

  std::vector<std::filesystem::path> GetRaw() const;

  bool SetChannelEnabled(std::string_view label, bool enabled, std::string& error);

  const std::vector<InstrumentChannel>& channels() const;
  std::vector<InstrumentChannel> active_channels() const;
  double sample_rate_hz() const;
  const FramesInstrumentOptions& options() const;

  // Null until the first Reset()/Start().
  collectors::FrameCollector* collector();

private:
  std::vector<std::string> ChannelLabels() const;

  FramesInstrumentOptions options_;
  remote::IRemoteExecutor& executor_;
  core::logging::Logger& logger_;
  std::vector<InstrumentChannel> channels_;
  std::unique_ptr<collectors::FrameCollector> collector_;
  bool need_reset_ = true;
  std::optional<std::filesystem::path> raw_file_;
};

} // namespace framescope::instrument
