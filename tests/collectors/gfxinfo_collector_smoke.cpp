#include "collectors/collector_factory.hpp"
#include "collectors/gfxinfo_collector.hpp"
#include "common/assertions.hpp"
#include "common/collector_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "core/logging/logger.hpp"
#include "remote/testing/scripted_executor.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using framescope::collectors::CollectorKind;
using framescope::collectors::FrameCollector;
using framescope::collectors::GfxinfoFrameCollector;
using framescope::core::logging::LogLevel;
using framescope::core::logging::Logger;
using framescope::remote::RemoteFailure;
using framescope::remote::RemoteFailureKind;
using framescope::remote::testing::ScriptedExecutor;
using namespace framescope::tests::common;

const std::string kPackage = "com.example.app";

const std::string kColumnListing = "Applications Graphics Acceleration Info:\n"
                                   "---PROFILEDATA---\n"
                                   "Flags,IntendedVsync,Vsync,FrameCompleted,\n"
                                   "---PROFILEDATA---\n";

const std::string kFramestatsDump = "\n** Graphics info for pid 4242 [com.example.app] **\n"
                                    "---PROFILEDATA---\n"
                                    "Flags,IntendedVsync,Vsync,FrameCompleted,\n"
                                    "0,100,110,150,\n"
                                    "1,200,210,260,\n"
                                    "---PROFILEDATA---\n";

void TestColumnDiscoveryAndSession() {
  ScopedTempDir temp("framescope-gfxinfo");
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;
  executor.AddResponse(GfxinfoFrameCollector::ListColumnsCommand(), Output(kColumnListing));
  executor.AddResponse(GfxinfoFrameCollector::FramestatsCommand(kPackage),
                       Output(kFramestatsDump));

  std::unique_ptr<FrameCollector> collector;
  RemoteFailure failure;
  std::string error;
  if (!framescope::collectors::CreateFrameCollector(CollectorKind::kGfxinfo, executor, logger,
                                                    std::nullopt, collector, failure, error)) {
    Fail("create failed: " + error);
  }
  Expect(collector->header() ==
             std::vector<std::string>{"Flags", "IntendedVsync", "Vsync", "FrameCompleted"},
         "expected discovered framestats columns");

  if (!collector->Clear(error)) {
    Fail("gfxinfo clear should be a no-op: " + error);
  }

  if (!collector->Start(kPackage, std::chrono::milliseconds(1), error)) {
    Fail("start failed: " + error);
  }
  WaitForCallCount(executor, GfxinfoFrameCollector::FramestatsCommand(kPackage), 2U);
  if (!collector->Stop(error)) {
    Fail("stop failed: " + error);
  }
  const std::uint64_t ticks = collector->ticks_completed();
  Expect(ticks >= 2U, "expected at least two ticks");

  if (!collector->ProcessFrames(std::nullopt, error)) {
    Fail("process failed: " + error);
  }
  // Every dump re-emits the ring buffer and rows are kept as-is.
  AssertEqualCount(collector->frames().size(), 2U * ticks, "framestats rows");
  AssertEqualCount(collector->parse_stats().blocks_seen, ticks, "framestats blocks");

  const auto csv = temp.path() / "gfx.csv";
  if (!collector->WriteFrames(csv, std::vector<std::string>{"Vsync", "Flags"}, error)) {
    Fail("write failed: " + error);
  }
  const std::string text = ReadFileToString(csv);
  AssertContains(text, "Vsync,Flags\n110,0\n210,1\n110,0\n");
}

void TestMissingColumnHeaderStillCreatesCollector() {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;
  executor.AddResponse(GfxinfoFrameCollector::ListColumnsCommand(),
                       Output("Unknown option: --list\n"));

  std::unique_ptr<FrameCollector> collector;
  RemoteFailure failure;
  std::string error;
  if (!framescope::collectors::CreateFrameCollector(CollectorKind::kGfxinfo, executor, logger,
                                                    std::nullopt, collector, failure, error)) {
    Fail("expected missing column header to be tolerated: " + error);
  }
  Expect(collector->header().empty(), "expected empty header when discovery finds nothing");
  AssertContains(log_sink.str(), "could not find framestats column header");
}

void TestDiscoveryCommunicationFaultFailsCreation() {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;
  executor.AddResponse(GfxinfoFrameCollector::ListColumnsCommand(),
                       Failure(RemoteFailureKind::kUnresponsive, "error: device offline"));

  std::unique_ptr<FrameCollector> collector;
  RemoteFailure failure;
  std::string error;
  Expect(!framescope::collectors::CreateFrameCollector(CollectorKind::kGfxinfo, executor, logger,
                                                       std::nullopt, collector, failure, error),
         "expected discovery fault to fail creation");
  AssertContains(error, "REMOTE_UNRESPONSIVE");
  Expect(failure.kind == RemoteFailureKind::kUnresponsive,
         "expected discovery failure kind to be reported");
  Expect(collector == nullptr, "expected no collector after failed creation");
}

void TestDiscoveryGenericFailureReportsItsKind() {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;
  executor.AddResponse(GfxinfoFrameCollector::ListColumnsCommand(),
                       Failure(RemoteFailureKind::kFailed, "exit_code=1"));

  std::unique_ptr<FrameCollector> collector;
  RemoteFailure failure;
  std::string error;
  Expect(!framescope::collectors::CreateFrameCollector(CollectorKind::kGfxinfo, executor, logger,
                                                       std::nullopt, collector, failure, error),
         "expected failed discovery call to fail creation");
  AssertContains(error, "REMOTE_FAILED");
  Expect(failure.kind == RemoteFailureKind::kFailed,
         "expected generic failure kind from discovery");
  Expect(!framescope::remote::IsCommunicationFault(failure.kind),
         "expected a generic failure not to count as a communication fault");
}

void TestFactoryValidatesKindAndHeader() {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  ScriptedExecutor executor;

  CollectorKind kind = CollectorKind::kSurfaceFlinger;
  std::string error;
  Expect(framescope::collectors::ParseCollectorKind("GfxInfo", kind, error),
         "expected case-insensitive backend name");
  Expect(kind == CollectorKind::kGfxinfo, "expected gfxinfo kind");
  Expect(!framescope::collectors::ParseCollectorKind("perfetto", kind, error),
         "expected unknown backend to fail");
  AssertContains(error, "surfaceflinger|gfxinfo");

  std::unique_ptr<FrameCollector> collector;
  RemoteFailure failure{.kind = RemoteFailureKind::kTimeout, .detail = "stale"};
  Expect(!framescope::collectors::CreateFrameCollector(
             CollectorKind::kSurfaceFlinger, executor, logger,
             std::vector<std::string>{"a", "b"}, collector, failure, error),
         "expected two-column surfaceflinger header to fail");
  AssertContains(error, "exactly 3 columns");
  Expect(failure.kind == RemoteFailureKind::kNone,
         "expected header validation to report no remote failure");
}

} // namespace

int main() {
  TestColumnDiscoveryAndSession();
  TestMissingColumnHeaderStillCreatesCollector();
  TestDiscoveryCommunicationFaultFailsCreation();
  TestDiscoveryGenericFailureReportsItsKind();
  TestFactoryValidatesKindAndHeader();
  return 0;
}
