#pragma once

#include "remote/remote_executor.hpp"

#include <chrono>
#include <string>

namespace framescope::remote {

struct AdbExecutorConfig {
  // Empty selects adb's default device.
  std::string serial;
  std::string adb_binary = "adb";
  // Zero disables the `timeout` wrapper.
  std::chrono::seconds command_timeout{30};
};

// Runs commands on an Android device through `adb shell`.
//
// Each call spawns one host process and blocks until it exits. stderr is folded
// into the captured output so adb transport errors can be classified.
class AdbShellExecutor final : public IRemoteExecutor {
public:
  explicit AdbShellExecutor(AdbExecutorConfig config);

  bool Execute(const std::string& command, std::string& output, RemoteFailure& failure) override;

  // Host command line used for `command`; exposed for diagnostics and tests.
  std::string BuildHostCommand(const std::string& command) const;

private:
  AdbExecutorConfig config_;
};

} // namespace framescope::remote
