#pragma once

#include "collectors/collector_factory.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace framescope::cli {

// Options for `framescope capture`: one live session against a device.
struct CaptureOptions {
  collectors::CollectorKind kind = collectors::CollectorKind::kSurfaceFlinger;
  std::string target;
  std::filesystem::path output_path;
  std::chrono::milliseconds period{2000};
  std::chrono::milliseconds duration{10000};
  std::optional<std::vector<std::string>> columns;
  bool keep_raw = false;
  bool clear_before_start = false;
  std::string serial;
  std::chrono::seconds command_timeout{30};
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Options for `framescope parse`: offline processing of a kept raw capture.
struct ParseOptions {
  collectors::CollectorKind kind = collectors::CollectorKind::kSurfaceFlinger;
  std::filesystem::path raw_path;
  std::filesystem::path output_path;
  std::optional<std::vector<std::string>> header;
  std::optional<std::vector<std::string>> columns;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Options for `framescope last-dump`.
struct LastDumpOptions {
  std::filesystem::path raw_path;
  std::optional<std::filesystem::path> output_path;
};

bool ParseCaptureOptions(const std::vector<std::string_view>& args, CaptureOptions& options,
                         std::string& error);
bool ParseParseOptions(const std::vector<std::string_view>& args, ParseOptions& options,
                       std::string& error);
bool ParseLastDumpOptions(const std::vector<std::string_view>& args, LastDumpOptions& options,
                          std::string& error);

// Routes `framescope` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   20 => remote target unresponsive or timed out
//   30 => raw capture file is corrupted
int Dispatch(int argc, char** argv);

} // namespace framescope::cli
