#include "instrument/frames_instrument.hpp"

#include "collectors/gfxinfo_collector.hpp"
#include "frames/frame_types.hpp"

#include <utility>

namespace framescope::instrument {

namespace {

constexpr std::string_view kTimeSuffix = "_time";

std::string StripTimeSuffix(const std::string& field) {
  if (field.size() > kTimeSuffix.size() &&
      field.compare(field.size() - kTimeSuffix.size(), kTimeSuffix.size(), kTimeSuffix) == 0) {
    return field.substr(0, field.size() - kTimeSuffix.size());
  }
  return field;
}

} // namespace

bool BuildFramesChannels(const collectors::CollectorKind kind, remote::IRemoteExecutor& executor,
                         core::logging::Logger& logger, std::vector<InstrumentChannel>& channels,
                         std::string& error) {
  channels.clear();

  if (kind == collectors::CollectorKind::kSurfaceFlinger) {
    for (const auto& field : frames::LatencyFrameFields()) {
      channels.push_back({StripTimeSuffix(field), std::string(kTimeUsChannelKind), true});
    }
    return true;
  }

  std::vector<std::string> columns;
  remote::RemoteFailure failure;
  if (!collectors::ReadGfxinfoColumns(executor, logger, columns, failure, error)) {
    return false;
  }
  for (auto& column : columns) {
    const std::string_view channel_kind = column == "Flags" ? kFlagsChannelKind : kTimeUsChannelKind;
    channels.push_back({std::move(column), std::string(channel_kind), true});
  }
  return true;
}

FramesInstrument::FramesInstrument(FramesInstrumentOptions options,
                                   remote::IRemoteExecutor& executor,
                                   core::logging::Logger& logger,
                                   std::vector<InstrumentChannel> channels)
    : options_(std::move(options)),
      executor_(executor),
      logger_(logger),
      channels_(std::move(channels)) {}

bool FramesInstrument::Create(FramesInstrumentOptions options, remote::IRemoteExecutor& executor,
                              core::logging::Logger& logger,
                              std::unique_ptr<FramesInstrument>& instrument, std::string& error) {
  if (options.collector_target.empty()) {
    error = "frames instrument requires a collector target";
    return false;
  }
  if (options.period <= std::chrono::milliseconds::zero()) {
    error = "frames instrument period must be positive";
    return false;
  }

  std::vector<InstrumentChannel> channels;
  if (!BuildFramesChannels(options.kind, executor, logger, channels, error)) {
    return false;
  }
  instrument = std::make_unique<FramesInstrument>(std::move(options), executor, logger,
                                                  std::move(channels));
  return true;
}

bool FramesInstrument::Reset(std::string& error) {
  if (collector_ != nullptr && collector_->state() == collectors::CollectorState::kRunning) {
    error = "cannot reset frames instrument while collection is running";
    return false;
  }

  std::unique_ptr<collectors::FrameCollector> fresh;
  remote::RemoteFailure failure;
  if (!collectors::CreateFrameCollector(options_.kind, executor_, logger_, ChannelLabels(), fresh,
                                        failure, error)) {
    return false;
  }
  collector_ = std::move(fresh);
  need_reset_ = false;
  raw_file_.reset();
  return true;
}

bool FramesInstrument::Start(std::string& error) {
  if (need_reset_ && !Reset(error)) {
    return false;
  }
  return collector_->Start(options_.collector_target, options_.period, error);
}

bool FramesInstrument::Stop(std::string& error) {
  if (collector_ == nullptr) {
    error = "frames instrument was never started";
    return false;
  }
  need_reset_ = true;
  return collector_->Stop(error);
}

bool FramesInstrument::GetData(const std::filesystem::path& outfile,
                               MeasurementsCsv& measurements, std::string& error) {
  if (collector_ == nullptr) {
    error = "frames instrument has no collected session";
    return false;
  }

  if (options_.keep_raw) {
    raw_file_ = std::filesystem::path(outfile.string() + ".raw");
  } else {
    raw_file_.reset();
  }
  if (!collector_->ProcessFrames(raw_file_, error)) {
    return false;
  }

  const std::vector<InstrumentChannel> active = active_channels();
  std::vector<std::string> labels;
  labels.reserve(active.size());
  for (const auto& channel : active) {
    labels.push_back(channel.label);
  }
  if (!collector_->WriteFrames(outfile, labels, error)) {
    return false;
  }

  measurements = MeasurementsCsv{outfile, active, sample_rate_hz()};
  return true;
}

std::vector<std::filesystem::path> FramesInstrument::GetRaw() const {
  if (raw_file_.has_value()) {
    return {*raw_file_};
  }
  return {};
}

bool FramesInstrument::SetChannelEnabled(std::string_view label, const bool enabled,
                                         std::string& error) {
  for (auto& channel : channels_) {
    if (channel.label == label) {
      channel.active = enabled;
      return true;
    }
  }
  error = "unknown frames channel '" + std::string(label) + "'";
  return false;
}

const std::vector<InstrumentChannel>& FramesInstrument::channels() const {
  return channels_;
}

std::vector<InstrumentChannel> FramesInstrument::active_channels() const {
  std::vector<InstrumentChannel> active;
  for (const auto& channel : channels_) {
    if (channel.active) {
      active.push_back(channel);
    }
  }
  return active;
}

double FramesInstrument::sample_rate_hz() const {
  if (options_.period <= std::chrono::milliseconds::zero()) {
    return 0.0;
  }
  return 1000.0 / static_cast<double>(options_.period.count());
}

const FramesInstrumentOptions& FramesInstrument::options() const {
  return options_;
}

collectors::FrameCollector* FramesInstrument::collector() {
  return collector_.get();
}

std::vector<std::string> FramesInstrument::ChannelLabels() const {
  std::vector<std::string> labels;
  labels.reserve(channels_.size());
  for (const auto& channel : channels_) {
    labels.push_back(channel.label);
  }
  return labels;
}

} // namespace framescope::instrument
