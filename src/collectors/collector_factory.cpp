#include "collectors/collector_factory.hpp"

#include "collectors/gfxinfo_collector.hpp"
#include "collectors/surfaceflinger_collector.hpp"
#include "parsers/frame_stats_parser.hpp"
#include "parsers/latency_trace_parser.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace framescope::collectors {

std::string_view ToString(const CollectorKind kind) {
  switch (kind) {
  case CollectorKind::kSurfaceFlinger:
    return "surfaceflinger";
  case CollectorKind::kGfxinfo:
    return "gfxinfo";
  }
  return "surfaceflinger";
}

bool ParseCollectorKind(std::string_view raw, CollectorKind& kind, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "surfaceflinger") {
    kind = CollectorKind::kSurfaceFlinger;
    return true;
  }
  if (normalized == "gfxinfo") {
    kind = CollectorKind::kGfxinfo;
    return true;
  }

  error = "invalid backend '" + std::string(raw) + "' (expected surfaceflinger|gfxinfo)";
  return false;
}

bool CreateFrameCollector(const CollectorKind kind, remote::IRemoteExecutor& executor,
                          core::logging::Logger& logger,
                          const std::optional<std::vector<std::string>>& header,
                          std::unique_ptr<FrameCollector>& collector,
                          remote::RemoteFailure& failure, std::string& error) {
  failure = remote::RemoteFailure{};
  switch (kind) {
  case CollectorKind::kSurfaceFlinger:
    if (header.has_value() && header->size() != 3U) {
      error = "surfaceflinger header must name exactly 3 columns";
      return false;
    }
    collector = std::make_unique<SurfaceFlingerFrameCollector>(executor, logger, header);
    return true;
  case CollectorKind::kGfxinfo: {
    std::vector<std::string> columns;
    if (header.has_value()) {
      columns = *header;
    } else {
      if (!ReadGfxinfoColumns(executor, logger, columns, failure, error)) {
        return false;
      }
    }
    collector = std::make_unique<GfxinfoFrameCollector>(executor, logger, std::move(columns));
    return true;
  }
  }

  error = "unsupported collector kind";
  return false;
}

std::unique_ptr<parsers::IDumpParser> CreateDumpParser(const CollectorKind kind,
                                                       core::logging::Logger& logger) {
  if (kind == CollectorKind::kGfxinfo) {
    return std::make_unique<parsers::FrameStatsParser>(logger);
  }
  return std::make_unique<parsers::LatencyTraceParser>(logger);
}

} // namespace framescope::collectors
