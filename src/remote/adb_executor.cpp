#include "remote/adb_executor.hpp"

#include <cstdio>
#include <string>
#include <utility>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace framescope::remote {

namespace {

// Single-quotes `text` for POSIX sh, escaping embedded single quotes.
std::string ShellQuote(const std::string& text) {
  std::string quoted = "'";
  for (const char c : text) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error) {
  output.clear();
  exit_code = -1;
  error.clear();

  const std::string wrapped = command + " 2>&1";
#if defined(_WIN32)
  FILE* pipe = _popen(wrapped.c_str(), "r");
#else
  FILE* pipe = popen(wrapped.c_str(), "r");
#endif
  if (pipe == nullptr) {
    error = "failed to execute command: " + command;
    return false;
  }

  char buffer[4096];
  std::size_t read_bytes = 0;
  while ((read_bytes = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    output.append(buffer, read_bytes);
  }

#if defined(_WIN32)
  const int raw_status = _pclose(pipe);
  exit_code = raw_status;
#else
  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    exit_code = -1;
  } else if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif

  return true;
}

} // namespace

AdbShellExecutor::AdbShellExecutor(AdbExecutorConfig config) : config_(std::move(config)) {}

std::string AdbShellExecutor::BuildHostCommand(const std::string& command) const {
  std::string host_command;
  if (config_.command_timeout.count() > 0) {
    host_command += "timeout " + std::to_string(config_.command_timeout.count()) + " ";
  }
  host_command += config_.adb_binary;
  if (!config_.serial.empty()) {
    host_command += " -s " + ShellQuote(config_.serial);
  }
  host_command += " shell " + ShellQuote(command);
  return host_command;
}

bool AdbShellExecutor::Execute(const std::string& command, std::string& output,
                               RemoteFailure& failure) {
  failure = RemoteFailure{};

  int exit_code = -1;
  std::string error;
  if (!RunShellCommand(BuildHostCommand(command), output, exit_code, error)) {
    failure.kind = RemoteFailureKind::kFailed;
    failure.detail = error;
    return false;
  }

  const RemoteFailureKind kind = ClassifyCommandResult(exit_code, output);
  if (kind == RemoteFailureKind::kNone) {
    return true;
  }

  failure.kind = kind;
  failure.detail = "exit_code=" + std::to_string(exit_code);
  return false;
}

} // namespace framescope::remote
