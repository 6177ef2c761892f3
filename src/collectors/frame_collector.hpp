#pragma once

#include "collectors/raw_sample_sink.hpp"
#include "core/logging/logger.hpp"
#include "frames/frame_table.hpp"
#include "parsers/dump_parser.hpp"
#include "remote/remote_executor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace framescope::collectors {

enum class CollectorState {
  kIdle = 0,
  kRunning,
  kStopped,
  kProcessed,
};

std::string_view ToString(CollectorState state);

// Above this many unresponsive dumps in one session Stop() logs a warning.
inline constexpr std::uint64_t kUnresponsiveWarnThreshold = 10U;

// What the sampling worker reports back to Stop() once it exits.
struct CollectorOutcome {
  bool ok = true;
  remote::RemoteFailureKind failure_kind = remote::RemoteFailureKind::kNone;
  std::string error;
  std::uint64_t ticks_completed = 0U;
};

// Longest sampling period Start() accepts.
inline constexpr std::chrono::milliseconds kMaxCollectorPeriod{24LL * 60 * 60 * 1000};

// Periodic frame-telemetry collector.
//
// Lifecycle (all calls from one owning thread):
//   kIdle --Start--> kRunning --Stop--> kStopped --ProcessFrames--> kProcessed
//   kStopped/kProcessed --Reset--> kIdle
//
// While running, one worker thread calls CollectOnce() and then sleeps for the
// configured period, measured from the end of the sample (no drift
// correction). Stop() interrupts the sleep but never a remote call in progress.
//
// Remote unresponsive/timeout failures end the session and are reported by
// Stop(). Any other tick failure, including any exception thrown by a tick, is
// recorded as a deferred fault naming this collector and also reported by
// Stop(). The raw sample file belongs to the worker while running and to the
// caller afterwards; ProcessFrames() parses and then deletes it.
class FrameCollector {
public:
  FrameCollector(remote::IRemoteExecutor& executor, core::logging::Logger& logger,
                 std::string name, std::vector<std::string> header);
  virtual ~FrameCollector();

  FrameCollector(const FrameCollector&) = delete;
  FrameCollector& operator=(const FrameCollector&) = delete;
  FrameCollector(FrameCollector&&) = delete;
  FrameCollector& operator=(FrameCollector&&) = delete;

  // `source_id` selects what to sample (a SurfaceFlinger view or a package).
  bool Start(std::string source_id, std::chrono::milliseconds period, std::string& error);

  bool Stop(std::string& error);

  // Parses the raw capture into frames(). When `raw_copy_path` is set the raw
  // file is copied there before it is removed.
  bool ProcessFrames(const std::optional<std::filesystem::path>& raw_copy_path,
                     std::string& error);

  bool WriteFrames(const std::filesystem::path& outfile,
                   const std::optional<std::vector<std::string>>& columns,
                   std::string& error) const;

  // Drops the parsed frames and any unprocessed raw file.
  bool Reset(std::string& error);

  // Resets the target's own frame counters before a session.
  virtual bool Clear(std::string& error) = 0;

  CollectorState state() const;
  const std::string& name() const;
  const std::string& source_id() const;
  std::chrono::milliseconds period() const;
  const std::vector<std::string>& header() const;
  const frames::FrameTable& frames() const;
  const parsers::ParseStats& parse_stats() const;
  std::uint64_t unresponsive_count() const;
  std::uint64_t ticks_completed() const;
  const std::filesystem::path& raw_path() const;
  // Remote failure that ended the last session; kNone when it ended cleanly or
  // on a fault that did not come from the executor.
  remote::RemoteFailureKind last_failure_kind() const;

protected:
  // Pulls one raw sample and appends it to `sink`. Returns false to end the
  // session; remote faults are described in `failure`.
  virtual bool CollectOnce(RawSampleSink& sink, remote::RemoteFailure& failure,
                           std::string& error) = 0;

  virtual parsers::IDumpParser& parser() = 0;

  // Runs one remote command. On failure `error` holds the formatted fault.
  bool ExecuteRemote(const std::string& command, std::string& output,
                     remote::RemoteFailure& failure, std::string& error);

  // Counts unresponsive dumps seen while sampling (safe from the worker).
  void RecordUnresponsive(std::uint64_t count);

  // Joins a still-running worker. Concrete collectors call this from their
  // destructor, before the overrides used by the worker are destroyed.
  void ShutdownWorker();

  core::logging::Logger& logger();

private:
  void RunLoop(RawSampleSink sink, std::promise<CollectorOutcome> outcome);
  bool RunTick(RawSampleSink& sink, CollectorOutcome& outcome);
  bool WaitForNextTick();
  bool StopRequested();
  void RemoveRawFile();

  remote::IRemoteExecutor& executor_;
  core::logging::Logger& logger_;
  std::string name_;
  std::vector<std::string> header_;

  CollectorState state_ = CollectorState::kIdle;
  std::string source_id_;
  std::chrono::milliseconds period_{0};
  std::filesystem::path raw_path_;

  std::thread worker_;
  std::future<CollectorOutcome> outcome_;
  std::mutex stop_mu_;
  std::condition_variable stop_cv_;
  bool stop_requested_ = false;
  std::atomic<std::uint64_t> runtime_unresponsive_{0U};

  frames::FrameTable table_;
  parsers::ParseStats parse_stats_;
  std::uint64_t unresponsive_count_ = 0U;
  std::uint64_t ticks_completed_ = 0U;
  remote::RemoteFailureKind last_failure_kind_ = remote::RemoteFailureKind::kNone;
};

} // namespace framescope::collectors
