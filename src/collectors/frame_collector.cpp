#include "collectors/frame_collector.hpp"

#include "core/fs_utils.hpp"

#include <exception>
#include <fstream>
#include <system_error>
#include <utility>

namespace framescope::collectors {

std::string_view ToString(const CollectorState state) {
  switch (state) {
  case CollectorState::kIdle:
    return "idle";
  case CollectorState::kRunning:
    return "running";
  case CollectorState::kStopped:
    return "stopped";
  case CollectorState::kProcessed:
    return "processed";
  }
  return "idle";
}

FrameCollector::FrameCollector(remote::IRemoteExecutor& executor, core::logging::Logger& logger,
                               std::string name, std::vector<std::string> header)
    : executor_(executor),
      logger_(logger),
      name_(std::move(name)),
      header_(std::move(header)),
      table_(header_) {}

FrameCollector::~FrameCollector() {
  ShutdownWorker();
  RemoveRawFile();
}

bool FrameCollector::Start(std::string source_id, const std::chrono::milliseconds period,
                           std::string& error) {
  if (state_ == CollectorState::kRunning) {
    error = "frame collector '" + name_ + "' is already running";
    return false;
  }
  if (state_ != CollectorState::kIdle) {
    error = "frame collector '" + name_ + "' holds a " + std::string(ToString(state_)) +
            " session; call Reset before starting again";
    return false;
  }
  if (source_id.empty()) {
    error = "frame collector '" + name_ + "' requires a non-empty source id";
    return false;
  }
  if (period < std::chrono::milliseconds::zero()) {
    error = "frame collector period cannot be negative";
    return false;
  }
  if (period > kMaxCollectorPeriod) {
    error = "frame collector period cannot exceed " +
            std::to_string(kMaxCollectorPeriod.count()) + " ms";
    return false;
  }

  RawSampleSink sink;
  const std::filesystem::path raw_path = core::BuildUniqueTempFilePath("framescope-" + name_);
  if (!sink.Open(raw_path, error)) {
    return false;
  }

  source_id_ = std::move(source_id);
  period_ = period;
  raw_path_ = raw_path;
  last_failure_kind_ = remote::RemoteFailureKind::kNone;
  runtime_unresponsive_.store(0U);
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    stop_requested_ = false;
  }

  std::promise<CollectorOutcome> outcome;
  outcome_ = outcome.get_future();
  worker_ = std::thread(&FrameCollector::RunLoop, this, std::move(sink), std::move(outcome));
  state_ = CollectorState::kRunning;

  logger_.Info("frame collection started", {{"collector", name_},
                                            {"source_id", source_id_},
                                            {"period_ms", std::to_string(period_.count())},
                                            {"raw_path", raw_path_.string()}});
  return true;
}

bool FrameCollector::Stop(std::string& error) {
  if (state_ != CollectorState::kRunning) {
    error = "cannot stop frame collector '" + name_ + "': it is " +
            std::string(ToString(state_)) + ", not running";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
  worker_.join();
  state_ = CollectorState::kStopped;

  const CollectorOutcome outcome = outcome_.get();
  ticks_completed_ = outcome.ticks_completed;
  last_failure_kind_ = outcome.failure_kind;
  unresponsive_count_ = runtime_unresponsive_.load();

  if (unresponsive_count_ > 0U) {
    const std::string count = std::to_string(unresponsive_count_);
    if (unresponsive_count_ > kUnresponsiveWarnThreshold) {
      logger_.Warn("frame collector target was unresponsive",
                   {{"collector", name_}, {"count", count}});
    } else {
      logger_.Debug("frame collector target was unresponsive",
                    {{"collector", name_}, {"count", count}});
    }
  }

  logger_.Info("frame collection stopped",
               {{"collector", name_}, {"ticks", std::to_string(ticks_completed_)}});

  if (!outcome.ok) {
    error = outcome.error;
    return false;
  }
  return true;
}

bool FrameCollector::ProcessFrames(const std::optional<std::filesystem::path>& raw_copy_path,
                                   std::string& error) {
  switch (state_) {
  case CollectorState::kIdle:
    error = "attempting to process frames before running the collector";
    return false;
  case CollectorState::kRunning:
    error = "cannot process frames while frame collector '" + name_ +
            "' is running; call Stop first";
    return false;
  case CollectorState::kProcessed:
    error = "frames were already processed for this session";
    return false;
  case CollectorState::kStopped:
    break;
  }

  table_.SetHeader(header_);
  parse_stats_ = parsers::ParseStats{};
  {
    std::ifstream raw(raw_path_, std::ios::binary);
    if (!raw) {
      error = "failed to open raw sample file '" + raw_path_.string() + "'";
      return false;
    }
    parser().Parse(raw, table_, parse_stats_);
  }

  if (raw_copy_path.has_value() && !core::CopyFileOverwrite(raw_path_, *raw_copy_path, error)) {
    return false;
  }
  RemoveRawFile();

  unresponsive_count_ = parse_stats_.unresponsive_count;
  state_ = CollectorState::kProcessed;

  logger_.Info("frames processed", {{"collector", name_},
                                    {"parser", parser().name()},
                                    {"frames", std::to_string(table_.size())},
                                    {"stale", std::to_string(parse_stats_.stale_frames)},
                                    {"bogus", std::to_string(parse_stats_.bogus_frames)},
                                    {"malformed", std::to_string(parse_stats_.malformed_records)}});
  return true;
}

bool FrameCollector::WriteFrames(const std::filesystem::path& outfile,
                                 const std::optional<std::vector<std::string>>& columns,
                                 std::string& error) const {
  if (state_ != CollectorState::kProcessed) {
    error = "frames have not been processed for this session (collector is " +
            std::string(ToString(state_)) + ")";
    return false;
  }
  return table_.Write(outfile, columns, error);
}

bool FrameCollector::Reset(std::string& error) {
  if (state_ == CollectorState::kRunning) {
    error = "cannot reset frame collector '" + name_ + "' while it is running";
    return false;
  }

  RemoveRawFile();
  table_.SetHeader(header_);
  parse_stats_ = parsers::ParseStats{};
  unresponsive_count_ = 0U;
  ticks_completed_ = 0U;
  last_failure_kind_ = remote::RemoteFailureKind::kNone;
  source_id_.clear();
  state_ = CollectorState::kIdle;
  return true;
}

CollectorState FrameCollector::state() const {
  return state_;
}

const std::string& FrameCollector::name() const {
  return name_;
}

const std::string& FrameCollector::source_id() const {
  return source_id_;
}

std::chrono::milliseconds FrameCollector::period() const {
  return period_;
}

const std::vector<std::string>& FrameCollector::header() const {
  return header_;
}

const frames::FrameTable& FrameCollector::frames() const {
  return table_;
}

const parsers::ParseStats& FrameCollector::parse_stats() const {
  return parse_stats_;
}

std::uint64_t FrameCollector::unresponsive_count() const {
  return unresponsive_count_;
}

std::uint64_t FrameCollector::ticks_completed() const {
  return ticks_completed_;
}

const std::filesystem::path& FrameCollector::raw_path() const {
  return raw_path_;
}

remote::RemoteFailureKind FrameCollector::last_failure_kind() const {
  return last_failure_kind_;
}

bool FrameCollector::ExecuteRemote(const std::string& command, std::string& output,
                                   remote::RemoteFailure& failure, std::string& error) {
  if (executor_.Execute(command, output, failure)) {
    return true;
  }
  error = remote::FormatRemoteFailure(command, failure);
  return false;
}

void FrameCollector::RecordUnresponsive(const std::uint64_t count) {
  runtime_unresponsive_.fetch_add(count);
}

void FrameCollector::ShutdownWorker() {
  if (state_ != CollectorState::kRunning) {
    return;
  }
  std::string error;
  if (!Stop(error)) {
    logger_.Warn("frame collector stopped with an error during shutdown",
                 {{"collector", name_}, {"error", error}});
  }
}

core::logging::Logger& FrameCollector::logger() {
  return logger_;
}

void FrameCollector::RunLoop(RawSampleSink sink, std::promise<CollectorOutcome> outcome) {
  logger_.Debug("frame data collection loop started", {{"collector", name_}});

  CollectorOutcome result;
  while (!StopRequested()) {
    if (!RunTick(sink, result)) {
      break;
    }
    ++result.ticks_completed;
    if (!WaitForNextTick()) {
      break;
    }
  }
  const std::uint64_t raw_bytes = sink.bytes_written();
  sink.Close();

  logger_.Debug("frame data collection loop stopped",
                {{"collector", name_},
                 {"ticks", std::to_string(result.ticks_completed)},
                 {"raw_bytes", std::to_string(raw_bytes)}});
  outcome.set_value(std::move(result));
}

bool FrameCollector::RunTick(RawSampleSink& sink, CollectorOutcome& outcome) {
  remote::RemoteFailure failure;
  std::string error;
  bool collected = false;
  try {
    collected = CollectOnce(sink, failure, error);
  } catch (const std::exception& ex) {
    error = std::string("unexpected exception: ") + ex.what();
  } catch (...) {
    error = "unexpected non-standard exception";
  }
  if (collected) {
    return true;
  }

  outcome.ok = false;
  outcome.failure_kind = failure.kind;
  if (remote::IsCommunicationFault(failure.kind)) {
    outcome.error = "frame collector '" + name_ + "' lost the target: " + error;
    logger_.Error("frame collector target failure",
                  {{"collector", name_},
                   {"code", remote::ToStableErrorCode(failure.kind)},
                   {"error", error}});
  } else {
    outcome.error = "frame collector '" + name_ + "' worker failed: " + error;
    logger_.Warn("exception on frame collector worker", {{"collector", name_}, {"error", error}});
  }
  return false;
}

bool FrameCollector::WaitForNextTick() {
  std::unique_lock<std::mutex> lock(stop_mu_);
  return !stop_cv_.wait_for(lock, period_, [this] { return stop_requested_; });
}

bool FrameCollector::StopRequested() {
  std::lock_guard<std::mutex> lock(stop_mu_);
  return stop_requested_;
}

void FrameCollector::RemoveRawFile() {
  if (raw_path_.empty()) {
    return;
  }
  std::error_code ec;
  if (!std::filesystem::remove(raw_path_, ec) && ec) {
    logger_.Warn("failed to remove raw sample file",
                 {{"path", raw_path_.string()}, {"error", ec.message()}});
  }
  raw_path_.clear();
}

} // namespace framescope::collectors
