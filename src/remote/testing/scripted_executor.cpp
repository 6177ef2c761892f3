#include "remote/testing/scripted_executor.hpp"

#include <algorithm>
#include <utility>

namespace framescope::remote::testing {

void ScriptedExecutor::AddResponse(const std::string& command, ScriptedResponse response) {
  std::lock_guard<std::mutex> lock(mu_);
  script_[command].push_back(std::move(response));
}

bool ScriptedExecutor::Execute(const std::string& command, std::string& output,
                               RemoteFailure& failure) {
  std::lock_guard<std::mutex> lock(mu_);
  calls_.push_back(command);
  failure = RemoteFailure{};
  output.clear();

  const auto it = script_.find(command);
  if (it == script_.end() || it->second.empty()) {
    failure.kind = RemoteFailureKind::kFailed;
    failure.detail = "no scripted response for command: " + command;
    return false;
  }

  ScriptedResponse response = it->second.front();
  if (it->second.size() > 1U) {
    it->second.pop_front();
  }

  output = std::move(response.output);
  if (response.failure == RemoteFailureKind::kNone) {
    return true;
  }
  failure.kind = response.failure;
  failure.detail = std::move(response.detail);
  return false;
}

std::size_t ScriptedExecutor::CallCount(const std::string& command) const {
  std::lock_guard<std::mutex> lock(mu_);
  return static_cast<std::size_t>(std::count(calls_.begin(), calls_.end(), command));
}

std::vector<std::string> ScriptedExecutor::calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return calls_;
}

} // namespace framescope::remote::testing
