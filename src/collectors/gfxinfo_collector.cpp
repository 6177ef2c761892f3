#include "collectors/gfxinfo_collector.hpp"

#include <sstream>
#include <utility>

namespace framescope::collectors {

bool ReadGfxinfoColumns(remote::IRemoteExecutor& executor, core::logging::Logger& logger,
                        std::vector<std::string>& columns, remote::RemoteFailure& failure,
                        std::string& error) {
  columns.clear();
  const std::string command = GfxinfoFrameCollector::ListColumnsCommand();
  std::string output;
  if (!executor.Execute(command, output, failure)) {
    error = remote::FormatRemoteFailure(command, failure);
    return false;
  }

  std::istringstream input(output);
  if (!parsers::ExtractFrameStatsHeader(input, columns)) {
    logger.Warn("could not find framestats column header in gfxinfo output",
                {{"command", command}});
    columns.clear();
    return true;
  }

  logger.Debug("discovered framestats columns", {{"count", std::to_string(columns.size())}});
  return true;
}

GfxinfoFrameCollector::GfxinfoFrameCollector(remote::IRemoteExecutor& executor,
                                             core::logging::Logger& logger,
                                             std::vector<std::string> header)
    : FrameCollector(executor, logger, "gfxinfo", std::move(header)), parser_(logger) {}

GfxinfoFrameCollector::~GfxinfoFrameCollector() {
  ShutdownWorker();
}

std::string GfxinfoFrameCollector::ListColumnsCommand() {
  return "dumpsys gfxinfo --list framestats";
}

std::string GfxinfoFrameCollector::FramestatsCommand(const std::string& package) {
  return "dumpsys gfxinfo " + package + " framestats";
}

bool GfxinfoFrameCollector::Clear(std::string& error) {
  error.clear();
  return true;
}

bool GfxinfoFrameCollector::CollectOnce(RawSampleSink& sink, remote::RemoteFailure& failure,
                                        std::string& error) {
  std::string dump;
  if (!ExecuteRemote(FramestatsCommand(source_id()), dump, failure, error)) {
    return false;
  }
  return sink.Append(dump, error);
}

parsers::IDumpParser& GfxinfoFrameCollector::parser() {
  return parser_;
}

} // namespace framescope::collectors
