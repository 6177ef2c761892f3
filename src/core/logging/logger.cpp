#include "core/logging/logger.hpp"

#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace framescope::core::logging {

namespace {

struct LevelName {
  std::string_view name;
  LogLevel level;
};

constexpr std::array<LevelName, 5> kLevelNames{{
    {"debug", LogLevel::kDebug},
    {"info", LogLevel::kInfo},
    {"warn", LogLevel::kWarn},
    {"warning", LogLevel::kWarn},
    {"error", LogLevel::kError},
}};

constexpr std::string_view kExpectedLevels = "debug|info|warn|error";

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

void AppendQuoted(std::string& out, std::string_view raw) {
  out.push_back('"');
  for (const char c : raw) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(c);
      break;
    }
  }
  out.push_back('"');
}

} // namespace

const char* ToString(const LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }
  return "INFO";
}

bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + std::string(kExpectedLevels) + ")";
    return false;
  }
  for (const auto& entry : kLevelNames) {
    if (EqualsIgnoreCase(raw, entry.name)) {
      level = entry.level;
      return true;
    }
  }
  error = "invalid --log-level '" + std::string(raw) + "' (expected " +
          std::string(kExpectedLevels) + ")";
  return false;
}

std::string FormatUtcTimestamp(const std::chrono::system_clock::time_point ts) {
  using namespace std::chrono;
  const auto millis = floor<milliseconds>(ts);
  const auto midnight = floor<days>(millis);
  const year_month_day date{midnight};
  const hh_mm_ss<milliseconds> time_of_day{millis - midnight};

  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(date.day()) << 'T' << std::setw(2) << time_of_day.hours().count()
      << ':' << std::setw(2) << time_of_day.minutes().count() << ':' << std::setw(2)
      << time_of_day.seconds().count() << '.' << std::setw(3)
      << time_of_day.subseconds().count() << 'Z';
  return out.str();
}

std::string FormatLogLine(std::string_view timestamp, const LogLevel level,
                          std::string_view session_id, std::string_view message,
                          std::initializer_list<LogFieldView> fields) {
  std::string line;
  line.reserve(64U + message.size());
  line += "ts_utc=";
  line += timestamp;
  line += " level=";
  line += ToString(level);
  line += " session_id=";
  AppendQuoted(line, session_id);
  line += " msg=";
  AppendQuoted(line, message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line += field.key;
    line.push_back('=');
    AppendQuoted(line, field.value);
  }
  return line;
}

Logger::Logger(const LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(out) {}

void Logger::SetSessionId(std::string session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  session_id_ = std::move(session_id);
}

void Logger::Log(const LogLevel level, std::string_view message,
                 std::initializer_list<LogFieldView> fields) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  const std::string timestamp = FormatUtcTimestamp(std::chrono::system_clock::now());

  std::lock_guard<std::mutex> lock(mu_);
  out_ << FormatLogLine(timestamp, level, session_id_, message, fields) << '\n';
  out_.flush();
}

} // namespace framescope::core::logging
