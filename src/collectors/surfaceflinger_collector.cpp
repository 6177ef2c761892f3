#include "collectors/surfaceflinger_collector.hpp"

#include "core/text_utils.hpp"
#include "frames/frame_types.hpp"

#include <sstream>
#include <utility>

namespace framescope::collectors {

namespace {

std::uint64_t CountOccurrences(std::string_view text, std::string_view needle) {
  std::uint64_t count = 0U;
  std::size_t pos = text.find(needle);
  while (pos != std::string_view::npos) {
    ++count;
    pos = text.find(needle, pos + needle.size());
  }
  return count;
}

} // namespace

SurfaceFlingerFrameCollector::SurfaceFlingerFrameCollector(
    remote::IRemoteExecutor& executor, core::logging::Logger& logger,
    std::optional<std::vector<std::string>> header)
    : FrameCollector(executor, logger, "surfaceflinger",
                     header.has_value() ? std::move(*header) : frames::LatencyFrameFields()),
      parser_(logger) {}

SurfaceFlingerFrameCollector::~SurfaceFlingerFrameCollector() {
  ShutdownWorker();
}

std::string SurfaceFlingerFrameCollector::ListCommand() {
  return "dumpsys SurfaceFlinger --list";
}

std::string SurfaceFlingerFrameCollector::LatencyCommand(const std::string& view) {
  return "dumpsys SurfaceFlinger --latency \"" + view + "\"";
}

std::string SurfaceFlingerFrameCollector::ClearCommand() {
  return "dumpsys SurfaceFlinger --latency-clear";
}

bool SurfaceFlingerFrameCollector::Clear(std::string& error) {
  remote::RemoteFailure failure;
  std::string output;
  return ExecuteRemote(ClearCommand(), output, failure, error);
}

bool SurfaceFlingerFrameCollector::ListViews(std::vector<std::string>& views,
                                             remote::RemoteFailure& failure,
                                             std::string& error) {
  views.clear();
  std::string output;
  if (!ExecuteRemote(ListCommand(), output, failure, error)) {
    return false;
  }

  std::istringstream input(output);
  std::string line;
  while (core::ReadNormalizedLine(input, line)) {
    const std::string_view view = core::TrimAscii(line);
    if (!view.empty()) {
      views.emplace_back(view);
    }
  }
  return true;
}

bool SurfaceFlingerFrameCollector::CollectOnce(RawSampleSink& sink,
                                               remote::RemoteFailure& failure,
                                               std::string& error) {
  std::vector<std::string> views;
  if (!ListViews(views, failure, error)) {
    return false;
  }

  for (const auto& view : views) {
    if (view != source_id()) {
      continue;
    }
    std::string latencies;
    if (!ExecuteRemote(LatencyCommand(view), latencies, failure, error)) {
      return false;
    }
    RecordUnresponsive(CountOccurrences(latencies, parsers::kSurfaceFlingerUnresponsiveMarker));
    // Keep the next tick's refresh-period line from joining this dump's last row.
    if (!latencies.empty() && latencies.back() != '\n' && latencies.back() != '\r') {
      latencies.push_back('\n');
    }
    if (!sink.Append(latencies, error)) {
      return false;
    }
  }
  return true;
}

parsers::IDumpParser& SurfaceFlingerFrameCollector::parser() {
  return parser_;
}

} // namespace framescope::collectors
