#pragma once

#include "collectors/frame_collector.hpp"
#include "parsers/latency_trace_parser.hpp"

#include <optional>
#include <string>
#include <vector>

namespace framescope::collectors {

// Samples `dumpsys SurfaceFlinger --latency` for one view per tick.
//
// Each tick lists the active views and dumps latency for every listed view
// equal to the session source id. A view that is not listed contributes
// nothing for that tick.
class SurfaceFlingerFrameCollector final : public FrameCollector {
public:
  // `header` replaces the default latency field names; it must have three names.
  SurfaceFlingerFrameCollector(remote::IRemoteExecutor& executor, core::logging::Logger& logger,
                               std::optional<std::vector<std::string>> header = std::nullopt);
  ~SurfaceFlingerFrameCollector() override;

  bool Clear(std::string& error) override;

  bool ListViews(std::vector<std::string>& views, remote::RemoteFailure& failure,
                 std::string& error);

  static std::string ListCommand();
  static std::string LatencyCommand(const std::string& view);
  static std::string ClearCommand();

protected:
  bool CollectOnce(RawSampleSink& sink, remote::RemoteFailure& failure,
                   std::string& error) override;

  parsers::IDumpParser& parser() override;

private:
  parsers::LatencyTraceParser parser_;
};

} // namespace framescope::collectors
