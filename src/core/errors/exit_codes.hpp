#pragma once

namespace modforge::core::errors {

// Process-exit contract for wrappers and CI:
// - 0 success (the linked image's modules file exists)
// - 1 any fatal failure, including malformed arguments
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace modforge::core::errors
