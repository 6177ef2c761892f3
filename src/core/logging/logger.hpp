#pragma once

#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace framescope::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

const char* ToString(LogLevel level);

// Accepts debug|info|warn|warning|error in any case.
bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error);

// `2024-01-02T03:04:05.678Z`, millisecond precision.
std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts);

// Renders one record without the trailing newline:
//   ts_utc=<ts> level=WARN session_id="..." msg="..." key="value" ...
// Quoted values escape backslash, quote, \n, \r and \t.
std::string FormatLogLine(std::string_view timestamp, LogLevel level,
                          std::string_view session_id, std::string_view message,
                          std::initializer_list<LogFieldView> fields);

// Line logger shared by the collector worker thread and the caller. The level
// filter is fixed at construction; each record is written and flushed under a
// lock so worker and caller lines never interleave.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Tags every later record; "-" until set.
  void SetSessionId(std::string session_id);

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {});

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }
  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }
  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }
  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  const LogLevel min_level_;
  std::mutex mu_;
  std::ostream& out_;
  std::string session_id_ = "-";
};

} // namespace framescope::core::logging
