#include "collectors/frame_collector.hpp"
#include "collectors/gfxinfo_collector.hpp"
#include "collectors/surfaceflinger_collector.hpp"
#include "common/assertions.hpp"
#include "common/collector_fixtures.hpp"
#include "core/logging/logger.hpp"
#include "frames/frame_types.hpp"
#include "parsers/latency_trace_parser.hpp"
#include "remote/testing/scripted_executor.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using framescope::collectors::FrameCollector;
using framescope::collectors::GfxinfoFrameCollector;
using framescope::collectors::RawSampleSink;
using framescope::collectors::SurfaceFlingerFrameCollector;
using framescope::core::logging::LogLevel;
using framescope::core::logging::Logger;
using framescope::remote::RemoteFailureKind;
using framescope::remote::testing::ScriptedExecutor;
using namespace framescope::tests::common;

// Collector whose sampling step throws after a configurable number of ticks.
// With `throw_int` set it throws a plain int instead of a std::exception.
class ThrowingCollector final : public FrameCollector {
public:
  ThrowingCollector(ScriptedExecutor& executor, Logger& logger, int good_ticks,
                    bool throw_int = false)
      : FrameCollector(executor, logger, "throwing", framescope::frames::LatencyFrameFields()),
        parser_(logger),
        good_ticks_(good_ticks),
        throw_int_(throw_int) {}

  ~ThrowingCollector() override { ShutdownWorker(); }

  bool Clear(std::string& error) override {
    error.clear();
    return true;
  }

  int attempts() const { return attempts_.load(); }

protected:
  bool CollectOnce(RawSampleSink& sink, framescope::remote::RemoteFailure& failure,
                   std::string& error) override {
    static_cast<void>(failure);
    if (attempts_.fetch_add(1) >= good_ticks_) {
      if (throw_int_) {
        throw 42;
      }
      throw std::runtime_error("sampling exploded");
    }
    return sink.Append("16666666\n", error);
  }

  framescope::parsers::IDumpParser& parser() override { return parser_; }

private:
  framescope::parsers::LatencyTraceParser parser_;
  int good_ticks_;
  bool throw_int_;
  std::atomic<int> attempts_{0};
};

void TestCommunicationFaultEndsSession(const RemoteFailureKind kind,
                                       const std::string& stable_code) {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;
  const std::string list_command = SurfaceFlingerFrameCollector::ListCommand();
  executor.AddResponse(list_command, Output("SurfaceView\n"));
  executor.AddResponse(list_command, Failure(kind, "exit_code=255"));
  executor.AddResponse(SurfaceFlingerFrameCollector::LatencyCommand("SurfaceView"),
                       Output("16666666\n10 20 30\n"));

  SurfaceFlingerFrameCollector collector(executor, logger);
  std::string error;
  if (!collector.Start("SurfaceView", std::chrono::milliseconds(1), error)) {
    Fail("start failed: " + error);
  }
  WaitForCallCount(executor, list_command, 2U);
  // The fault ends the loop on its own; Stop() only joins and reports it.
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  const std::size_t calls_after_fault = executor.CallCount(list_command);

  Expect(!collector.Stop(error), "expected stop to surface the communication fault");
  AssertContains(error, "frame collector 'surfaceflinger' lost the target");
  AssertContains(error, stable_code);
  Expect(collector.last_failure_kind() == kind, "expected failure kind to be recorded");
  AssertEqualCount(collector.ticks_completed(), 1U, "ticks before the fault");
  AssertEqualCount(executor.CallCount(list_command), calls_after_fault,
                   "list calls after the fault");

  // Samples collected before the fault are still processable.
  if (!collector.ProcessFrames(std::nullopt, error)) {
    Fail("process after fault failed: " + error);
  }
  AssertEqualCount(collector.frames().size(), 1U, "frames collected before the fault");
}

void TestGenericRemoteFailureIsWrapped() {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;
  const std::string command = GfxinfoFrameCollector::FramestatsCommand("com.example.app");
  executor.AddResponse(command, Failure(RemoteFailureKind::kFailed, "exit_code=1"));

  GfxinfoFrameCollector collector(executor, logger, {"Flags", "Vsync"});
  std::string error;
  if (!collector.Start("com.example.app", std::chrono::milliseconds(1), error)) {
    Fail("start failed: " + error);
  }
  WaitForCallCount(executor, command, 1U);
  Expect(!collector.Stop(error), "expected stop to surface the deferred fault");
  AssertContains(error, "frame collector 'gfxinfo' worker failed");
  AssertContains(error, "REMOTE_FAILED");
  Expect(collector.last_failure_kind() == RemoteFailureKind::kFailed,
         "expected generic failure kind");
  AssertEqualCount(executor.CallCount(command), 1U, "attempts after a failed tick");
}

void TestThrownExceptionIsWrapped() {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;

  ThrowingCollector collector(executor, logger, 2);
  std::string error;
  if (!collector.Start("anything", std::chrono::milliseconds(1), error)) {
    Fail("start failed: " + error);
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (collector.attempts() < 3) {
    if (std::chrono::steady_clock::now() >= deadline) {
      Fail("timed out waiting for the throwing tick");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  Expect(!collector.Stop(error), "expected stop to surface the thrown exception");
  AssertContains(error, "frame collector 'throwing' worker failed");
  AssertContains(error, "sampling exploded");
  Expect(collector.last_failure_kind() == RemoteFailureKind::kNone,
         "expected no remote failure kind for a thrown exception");
  AssertEqualCount(collector.ticks_completed(), 2U, "ticks before the exception");
  Expect(collector.attempts() == 3, "expected the loop to end at the throwing tick");
}

void TestNonStandardExceptionIsWrapped() {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;

  ThrowingCollector collector(executor, logger, 1, true);
  std::string error;
  if (!collector.Start("anything", std::chrono::milliseconds(1), error)) {
    Fail("start failed: " + error);
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (collector.attempts() < 2) {
    if (std::chrono::steady_clock::now() >= deadline) {
      Fail("timed out waiting for the throwing tick");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  Expect(!collector.Stop(error), "expected stop to surface the non-standard exception");
  AssertContains(error, "frame collector 'throwing' worker failed");
  AssertContains(error, "unexpected non-standard exception");
  AssertEqualCount(collector.ticks_completed(), 1U, "ticks before the exception");
}

void TestStartRejectsOutOfRangePeriod() {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;
  ThrowingCollector collector(executor, logger, 0);
  std::string error;

  Expect(!collector.Start("anything", std::chrono::milliseconds(10000000000000000LL), error),
         "expected an oversized period to be rejected");
  AssertContains(error, "period cannot exceed 86400000 ms");
  Expect(!collector.Start("anything", framescope::collectors::kMaxCollectorPeriod +
                                          std::chrono::milliseconds(1),
                          error),
         "expected a period just past the limit to be rejected");
  Expect(!collector.Start("anything", std::chrono::milliseconds(-1), error),
         "expected a negative period to be rejected");
  AssertContains(error, "cannot be negative");
  AssertEqualCount(static_cast<std::size_t>(collector.attempts()), 0U,
                   "samples taken by a rejected start");
}

void TestDestructorJoinsRunningWorker() {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;
  executor.AddResponse(GfxinfoFrameCollector::FramestatsCommand("com.example.app"),
                       Output("---PROFILEDATA---\nFlags,\n0,\n---PROFILEDATA---\n"));

  std::filesystem::path raw_path;
  {
    GfxinfoFrameCollector collector(executor, logger, {"Flags"});
    std::string error;
    if (!collector.Start("com.example.app", std::chrono::seconds(60), error)) {
      Fail("start failed: " + error);
    }
    raw_path = collector.raw_path();
    WaitForCallCount(executor, GfxinfoFrameCollector::FramestatsCommand("com.example.app"), 1U);
  }
  Expect(!std::filesystem::exists(raw_path), "expected destructor to remove the raw file");
}

} // namespace

int main() {
  TestCommunicationFaultEndsSession(RemoteFailureKind::kTimeout, "REMOTE_TIMEOUT");
  TestCommunicationFaultEndsSession(RemoteFailureKind::kUnresponsive, "REMOTE_UNRESPONSIVE");
  TestGenericRemoteFailureIsWrapped();
  TestThrownExceptionIsWrapped();
  TestNonStandardExceptionIsWrapped();
  TestStartRejectsOutOfRangePeriod();
  TestDestructorJoinsRunningWorker();
  return 0;
}
