#pragma once

#include "collectors/frame_collector.hpp"
#include "core/logging/logger.hpp"
#include "parsers/dump_parser.hpp"
#include "remote/remote_executor.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace framescope::collectors {

enum class CollectorKind {
  kSurfaceFlinger = 0,
  kGfxinfo,
};

std::string_view ToString(CollectorKind kind);

// Accepts "surfaceflinger" and "gfxinfo" (case-insensitive).
bool ParseCollectorKind(std::string_view raw, CollectorKind& kind, std::string& error);

// Builds a collector for `kind`.
//
// For gfxinfo without a caller-supplied `header`, the column header is
// discovered from the target first; a failed discovery call fails creation
// and leaves its kind in `failure`. Other failures leave `failure` at kNone.
bool CreateFrameCollector(CollectorKind kind, remote::IRemoteExecutor& executor,
                          core::logging::Logger& logger,
                          const std::optional<std::vector<std::string>>& header,
                          std::unique_ptr<FrameCollector>& collector,
                          remote::RemoteFailure& failure, std::string& error);

// Parser matching `kind`, for processing kept raw captures offline.
std::unique_ptr<parsers::IDumpParser> CreateDumpParser(CollectorKind kind,
                                                       core::logging::Logger& logger);

} // namespace framescope::collectors
