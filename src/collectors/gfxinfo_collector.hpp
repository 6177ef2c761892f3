#pragma once

#include "collectors/frame_collector.hpp"
#include "parsers/frame_stats_parser.hpp"

#include <string>
#include <vector>

namespace framescope::collectors {

// Discovers framestats column names with `dumpsys gfxinfo --list framestats`.
//
// A response without a profile-data block is logged and yields an empty
// `columns` list; only a failed remote call returns false.
bool ReadGfxinfoColumns(remote::IRemoteExecutor& executor, core::logging::Logger& logger,
                        std::vector<std::string>& columns, remote::RemoteFailure& failure,
                        std::string& error);

// Samples `dumpsys gfxinfo <package> framestats` once per tick and appends the
// output verbatim. The source rotates its own ring buffer, so Clear() is a
// no-op and consecutive dumps may repeat frames.
class GfxinfoFrameCollector final : public FrameCollector {
public:
  GfxinfoFrameCollector(remote::IRemoteExecutor& executor, core::logging::Logger& logger,
                        std::vector<std::string> header);
  ~GfxinfoFrameCollector() override;

  bool Clear(std::string& error) override;

  static std::string ListColumnsCommand();
  static std::string FramestatsCommand(const std::string& package);

protected:
  bool CollectOnce(RawSampleSink& sink, remote::RemoteFailure& failure,
                   std::string& error) override;

  parsers::IDumpParser& parser() override;

private:
  parsers::FrameStatsParser parser_;
};

} // namespace framescope::collectors
