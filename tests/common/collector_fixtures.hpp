#ifndef FRAMESCOPE_TESTS_COMMON_COLLECTOR_FIXTURES_HPP_
#define FRAMESCOPE_TESTS_COMMON_COLLECTOR_FIXTURES_HPP_

#include "assertions.hpp"
#include "remote/testing/scripted_executor.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <thread>
#include <utility>

namespace framescope::tests::common {

// Blocks until the collector worker has issued `command` at least `count`
// times. Sessions only observe Stop() between ticks, so tests use this to make
// sure the ticks they depend on actually ran.
inline void WaitForCallCount(const remote::testing::ScriptedExecutor& executor,
                             const std::string& command, const std::size_t count) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (executor.CallCount(command) < count) {
    if (std::chrono::steady_clock::now() >= deadline) {
      Fail("timed out waiting for " + std::to_string(count) + " calls of: " + command);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
}

inline remote::testing::ScriptedResponse Output(std::string text) {
  return remote::testing::ScriptedResponse{std::move(text), remote::RemoteFailureKind::kNone, {}};
}

inline remote::testing::ScriptedResponse Failure(const remote::RemoteFailureKind kind,
                                                 std::string detail) {
  return remote::testing::ScriptedResponse{{}, kind, std::move(detail)};
}

} // namespace framescope::tests::common

#endif // FRAMESCOPE_TESTS_COMMON_COLLECTOR_FIXTURES_HPP_
