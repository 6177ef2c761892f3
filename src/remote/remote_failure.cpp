#include "remote/remote_executor.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>

namespace framescope::remote {

namespace {

// Exit status reported by coreutils `timeout` when the wrapped command expired.
constexpr int kTimeoutExitCode = 124;

std::string ToLowerAscii(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (const std::string_view needle : needles) {
    if (needle.empty()) {
      continue;
    }
    if (haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

std::string BuildActionableMessage(const RemoteFailureKind kind, std::string_view command) {
  const std::string command_label =
      command.empty() ? "remote command" : "'" + std::string(command) + "'";

  switch (kind) {
  case RemoteFailureKind::kUnresponsive:
    return "Target stopped responding while running " + command_label +
           "; check the device connection and authorization.";
  case RemoteFailureKind::kTimeout:
    return "Target timed out while running " + command_label +
           "; check device load or raise the command timeout.";
  case RemoteFailureKind::kFailed:
    return "Target failed to run " + command_label + "; inspect the command output.";
  case RemoteFailureKind::kNone:
    break;
  }
  return "Target reported no failure for " + command_label + ".";
}

} // namespace

std::string_view ToStableErrorCode(const RemoteFailureKind kind) {
  switch (kind) {
  case RemoteFailureKind::kNone:
    return "REMOTE_OK";
  case RemoteFailureKind::kUnresponsive:
    return "REMOTE_UNRESPONSIVE";
  case RemoteFailureKind::kTimeout:
    return "REMOTE_TIMEOUT";
  case RemoteFailureKind::kFailed:
    return "REMOTE_FAILED";
  }
  return "REMOTE_FAILED";
}

bool IsCommunicationFault(const RemoteFailureKind kind) {
  return kind == RemoteFailureKind::kUnresponsive || kind == RemoteFailureKind::kTimeout;
}

std::string FormatRemoteFailure(std::string_view command, const RemoteFailure& failure) {
  std::string text = std::string(ToStableErrorCode(failure.kind)) + ": " +
                     BuildActionableMessage(failure.kind, command);
  if (!failure.detail.empty()) {
    text += " detail: " + failure.detail;
  }
  return text;
}

RemoteFailureKind ClassifyCommandResult(const int exit_code, std::string_view output) {
  if (exit_code == kTimeoutExitCode) {
    return RemoteFailureKind::kTimeout;
  }

  const std::string lowered = ToLowerAscii(output);
  if (ContainsAny(lowered, {"device offline", "no devices/emulators found", "no devices found",
                            "device unauthorized", "not found", "closed"}) &&
      lowered.find("error:") != std::string::npos) {
    return RemoteFailureKind::kUnresponsive;
  }
  // Dump text may mention these words; only a failed adb call counts.
  if (exit_code != 0 && ContainsAny(lowered, {"device offline", "device unauthorized"})) {
    return RemoteFailureKind::kUnresponsive;
  }

  if (exit_code != 0) {
    return RemoteFailureKind::kFailed;
  }
  return RemoteFailureKind::kNone;
}

} // namespace framescope::remote
