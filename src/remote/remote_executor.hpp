#pragma once

#include <string>
#include <string_view>

namespace framescope::remote {

// Classification of a failed remote command.
//
// Unresponsive and timeout are communication faults: a running collection
// session treats them as fatal. Everything else is a generic command failure.
enum class RemoteFailureKind {
  kNone = 0,
  kUnresponsive,
  kTimeout,
  kFailed,
};

struct RemoteFailure {
  RemoteFailureKind kind = RemoteFailureKind::kNone;
  std::string detail;
};

std::string_view ToStableErrorCode(RemoteFailureKind kind);

// True for failures that mean the target stopped talking to us.
bool IsCommunicationFault(RemoteFailureKind kind);

// Returns single-line contract text:
//   "<STABLE_CODE>: <actionable_message> detail: <raw_detail>"
// The detail suffix is omitted when raw detail is empty.
std::string FormatRemoteFailure(std::string_view command, const RemoteFailure& failure);

// Classifies raw command output/exit status into a failure kind.
// `exit_code` 0 with no recognizable fault text maps to kNone.
RemoteFailureKind ClassifyCommandResult(int exit_code, std::string_view output);

// Synchronous command channel to the device under test.
//
// Implementations block for the whole round trip and do not retry. On failure
// they return false and describe the fault in `failure`; `output` holds
// whatever text was captured.
class IRemoteExecutor {
public:
  virtual ~IRemoteExecutor() = default;

  virtual bool Execute(const std::string& command, std::string& output,
                       RemoteFailure& failure) = 0;
};

} // namespace framescope::remote
