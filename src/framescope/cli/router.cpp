#include "framescope/cli/router.hpp"

#include "collectors/frame_collector.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/text_utils.hpp"
#include "frames/frame_table.hpp"
#include "frames/frame_types.hpp"
#include "parsers/dump_parser.hpp"
#include "parsers/frame_stats_parser.hpp"
#include "parsers/last_dump_extractor.hpp"
#include "remote/adb_executor.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace framescope::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitRemoteFailed = core::errors::ToInt(core::errors::ExitCode::kRemoteFailed);
constexpr int kExitCaptureCorrupted =
    core::errors::ToInt(core::errors::ExitCode::kCaptureCorrupted);

constexpr std::uint64_t kMaxCommandTimeoutSeconds = 24U * 60U * 60U;

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  framescope capture --backend <surfaceflinger|gfxinfo> --target <view|package> "
         "--out <file.csv> [--period-ms <n>] [--duration-ms <n>] [--columns <a,b,...>] "
         "[--keep-raw] [--clear] [--serial <serial>] [--timeout-s <n>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  framescope parse --backend <surfaceflinger|gfxinfo> --raw <file> --out <file.csv> "
         "[--header <a,b,...>] [--columns <a,b,...>] [--log-level <debug|info|warn|error>]\n"
      << "  framescope last-dump <raw-file> [--out <file>]\n"
      << "  framescope version\n";
}

bool ParseUnsigned(std::string_view text, std::uint64_t& value) {
  if (text.empty()) {
    return false;
  }
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }
  value = parsed;
  return true;
}

std::vector<std::string> ParseNameList(std::string_view text) {
  std::vector<std::string> names;
  for (const auto field : core::SplitCommas(text)) {
    const std::string_view name = core::TrimAscii(field);
    if (!name.empty()) {
      names.emplace_back(name);
    }
  }
  return names;
}

// Reads the value following option `args[i]`, advancing `i`.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

bool TakeNameList(const std::vector<std::string_view>& args, std::size_t& i,
                  std::optional<std::vector<std::string>>& names, std::string& error) {
  std::string_view value;
  if (!TakeValue(args, i, value, error)) {
    return false;
  }
  std::vector<std::string> parsed = ParseNameList(value);
  if (parsed.empty()) {
    error = std::string(args[i - 1]) + " requires at least one name";
    return false;
  }
  names = std::move(parsed);
  return true;
}

bool TakeLogLevel(const std::vector<std::string_view>& args, std::size_t& i,
                  core::logging::LogLevel& level, std::string& error) {
  std::string_view value;
  if (!TakeValue(args, i, value, error)) {
    return false;
  }
  return core::logging::ParseLogLevel(value, level, error);
}

bool TakeMillis(const std::vector<std::string_view>& args, std::size_t& i,
                std::chrono::milliseconds& millis, std::string& error) {
  std::string_view value;
  if (!TakeValue(args, i, value, error)) {
    return false;
  }
  std::uint64_t parsed = 0;
  if (!ParseUnsigned(value, parsed)) {
    error = "invalid value for " + std::string(args[i - 1]) + ": " + std::string(value);
    return false;
  }
  const auto max_millis = static_cast<std::uint64_t>(collectors::kMaxCollectorPeriod.count());
  if (parsed > max_millis) {
    error = "invalid value for " + std::string(args[i - 1]) + ": " + std::string(value) +
            " (max " + std::to_string(max_millis) + ")";
    return false;
  }
  millis = std::chrono::milliseconds(static_cast<std::int64_t>(parsed));
  return true;
}

std::string BuildSessionId(std::string_view prefix) {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return std::string(prefix) + "-" + std::to_string(now_ms);
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "framescope 0.1.0\n";
  return kExitSuccess;
}

int ExitCodeForRemoteFailure(const remote::RemoteFailureKind kind) {
  return remote::IsCommunicationFault(kind) ? kExitRemoteFailed : kExitFailure;
}

int CommandCapture(const std::vector<std::string_view>& args) {
  CaptureOptions options;
  std::string error;
  if (!ParseCaptureOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetSessionId(BuildSessionId("capture"));
  logger.Info("capture requested", {{"backend", collectors::ToString(options.kind)},
                                    {"target", options.target},
                                    {"out", options.output_path.string()}});

  remote::AdbShellExecutor executor(remote::AdbExecutorConfig{
      .serial = options.serial,
      .adb_binary = "adb",
      .command_timeout = options.command_timeout,
  });

  std::unique_ptr<collectors::FrameCollector> collector;
  remote::RemoteFailure discovery_failure;
  if (!collectors::CreateFrameCollector(options.kind, executor, logger, std::nullopt, collector,
                                        discovery_failure, error)) {
    logger.Error("failed to create frame collector",
                 {{"code", remote::ToStableErrorCode(discovery_failure.kind)}, {"error", error}});
    return ExitCodeForRemoteFailure(discovery_failure.kind);
  }

  if (options.clear_before_start && !collector->Clear(error)) {
    logger.Error("failed to clear target frame counters", {{"error", error}});
    return kExitRemoteFailed;
  }

  if (!collector->Start(options.target, options.period, error)) {
    logger.Error("failed to start frame collection", {{"error", error}});
    return kExitFailure;
  }

  std::this_thread::sleep_for(options.duration);

  if (!collector->Stop(error)) {
    logger.Error("frame collection failed", {{"error", error}});
    return ExitCodeForRemoteFailure(collector->last_failure_kind());
  }

  std::optional<fs::path> raw_copy;
  if (options.keep_raw) {
    raw_copy = fs::path(options.output_path.string() + ".raw");
  }
  if (!collector->ProcessFrames(raw_copy, error)) {
    logger.Error("failed to process frames", {{"error", error}});
    return kExitFailure;
  }

  if (!collector->WriteFrames(options.output_path, options.columns, error)) {
    logger.Error("failed to write frames", {{"error", error}});
    return kExitFailure;
  }

  std::cout << "capture complete: frames=" << collector->frames().size()
            << " ticks=" << collector->ticks_completed()
            << " unresponsive=" << collector->unresponsive_count()
            << " out=" << options.output_path.string() << '\n';
  return kExitSuccess;
}

bool ResolveOfflineHeader(const ParseOptions& options, std::vector<std::string>& header,
                          std::string& error) {
  if (options.header.has_value()) {
    header = *options.header;
    return true;
  }
  if (options.kind == collectors::CollectorKind::kSurfaceFlinger) {
    header = frames::LatencyFrameFields();
    return true;
  }

  std::ifstream raw(options.raw_path, std::ios::binary);
  if (!raw) {
    error = "failed to open raw capture '" + options.raw_path.string() + "'";
    return false;
  }
  if (!parsers::ExtractFrameStatsHeader(raw, header)) {
    error = "raw capture has no framestats header; pass --header";
    return false;
  }
  return true;
}

int CommandParse(const std::vector<std::string_view>& args) {
  ParseOptions options;
  std::string error;
  if (!ParseParseOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetSessionId(BuildSessionId("parse"));

  std::vector<std::string> header;
  if (!ResolveOfflineHeader(options, header, error)) {
    logger.Error("failed to resolve frame header", {{"error", error}});
    return kExitFailure;
  }

  std::ifstream raw(options.raw_path, std::ios::binary);
  if (!raw) {
    logger.Error("failed to open raw capture", {{"path", options.raw_path.string()}});
    return kExitFailure;
  }

  frames::FrameTable table(std::move(header));
  parsers::ParseStats stats;
  const auto parser = collectors::CreateDumpParser(options.kind, logger);
  parser->Parse(raw, table, stats);

  if (!table.Write(options.output_path, options.columns, error)) {
    logger.Error("failed to write frames", {{"error", error}});
    return kExitFailure;
  }

  std::cout << "parse complete: frames=" << table.size()
            << " unresponsive=" << stats.unresponsive_count
            << " out=" << options.output_path.string() << '\n';
  return kExitSuccess;
}

int CommandLastDump(const std::vector<std::string_view>& args) {
  LastDumpOptions options;
  std::string error;
  if (!ParseLastDumpOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  parsers::LastDumpExtraction extraction;
  if (!parsers::ExtractLastGfxinfoDump(options.raw_path, extraction, error)) {
    std::cerr << "error: " << error << '\n';
    return extraction.corrupted ? kExitCaptureCorrupted : kExitFailure;
  }
  if (!extraction.dump.has_value()) {
    std::cerr << "error: no gfxinfo dump found in " << options.raw_path.string() << '\n';
    return kExitFailure;
  }

  if (!options.output_path.has_value()) {
    std::cout << *extraction.dump;
    return kExitSuccess;
  }
  if (!core::WriteTextFileAtomic(*options.output_path, *extraction.dump, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  return kExitSuccess;
}

} // namespace

bool ParseCaptureOptions(const std::vector<std::string_view>& args, CaptureOptions& options,
                         std::string& error) {
  bool backend_seen = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--keep-raw") {
      options.keep_raw = true;
      continue;
    }
    if (token == "--clear") {
      options.clear_before_start = true;
      continue;
    }
    if (token == "--backend") {
      if (!TakeValue(args, i, value, error) ||
          !collectors::ParseCollectorKind(value, options.kind, error)) {
        return false;
      }
      backend_seen = true;
      continue;
    }
    if (token == "--target") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.target = std::string(value);
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_path = fs::path(value);
      continue;
    }
    if (token == "--period-ms") {
      if (!TakeMillis(args, i, options.period, error)) {
        return false;
      }
      continue;
    }
    if (token == "--duration-ms") {
      if (!TakeMillis(args, i, options.duration, error)) {
        return false;
      }
      continue;
    }
    if (token == "--columns") {
      if (!TakeNameList(args, i, options.columns, error)) {
        return false;
      }
      continue;
    }
    if (token == "--serial") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.serial = std::string(value);
      continue;
    }
    if (token == "--timeout-s") {
      std::uint64_t seconds = 0;
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (!ParseUnsigned(value, seconds)) {
        error = "invalid value for --timeout-s: " + std::string(value);
        return false;
      }
      if (seconds > kMaxCommandTimeoutSeconds) {
        error = "invalid value for --timeout-s: " + std::string(value) + " (max " +
                std::to_string(kMaxCommandTimeoutSeconds) + ")";
        return false;
      }
      options.command_timeout = std::chrono::seconds(static_cast<std::int64_t>(seconds));
      continue;
    }
    if (token == "--log-level") {
      if (!TakeLogLevel(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }

    error = "unknown option: " + std::string(token);
    return false;
  }

  if (!backend_seen) {
    error = "capture requires --backend <surfaceflinger|gfxinfo>";
    return false;
  }
  if (options.target.empty()) {
    error = "capture requires --target <view|package>";
    return false;
  }
  if (options.output_path.empty()) {
    error = "capture requires --out <file.csv>";
    return false;
  }
  if (options.period.count() == 0) {
    error = "--period-ms must be greater than 0";
    return false;
  }
  return true;
}

bool ParseParseOptions(const std::vector<std::string_view>& args, ParseOptions& options,
                       std::string& error) {
  bool backend_seen = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--backend") {
      if (!TakeValue(args, i, value, error) ||
          !collectors::ParseCollectorKind(value, options.kind, error)) {
        return false;
      }
      backend_seen = true;
      continue;
    }
    if (token == "--raw") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.raw_path = fs::path(value);
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_path = fs::path(value);
      continue;
    }
    if (token == "--header") {
      if (!TakeNameList(args, i, options.header, error)) {
        return false;
      }
      continue;
    }
    if (token == "--columns") {
      if (!TakeNameList(args, i, options.columns, error)) {
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      if (!TakeLogLevel(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }

    error = "unknown option: " + std::string(token);
    return false;
  }

  if (!backend_seen) {
    error = "parse requires --backend <surfaceflinger|gfxinfo>";
    return false;
  }
  if (options.raw_path.empty()) {
    error = "parse requires --raw <file>";
    return false;
  }
  if (options.output_path.empty()) {
    error = "parse requires --out <file.csv>";
    return false;
  }
  if (options.kind == collectors::CollectorKind::kSurfaceFlinger && options.header.has_value() &&
      options.header->size() != 3U) {
    error = "surfaceflinger --header must name exactly 3 columns";
    return false;
  }
  return true;
}

bool ParseLastDumpOptions(const std::vector<std::string_view>& args, LastDumpOptions& options,
                          std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--out") {
      std::string_view value;
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_path = fs::path(value);
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.raw_path.empty()) {
      error = "last-dump accepts exactly 1 raw capture path";
      return false;
    }
    options.raw_path = fs::path(token);
  }

  if (options.raw_path.empty()) {
    error = "last-dump requires exactly 1 argument: <raw-file>";
    return false;
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "capture") {
    return CommandCapture(args);
  }

  if (command == "parse") {
    return CommandParse(args);
  }

  if (command == "last-dump") {
    return CommandLastDump(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace framescope::cli
