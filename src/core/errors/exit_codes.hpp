#pragma once

namespace rawiface::core::errors {

// Process-exit contract for rawiface.
//
// - 0 success (only reachable through --dry-run, help and version; a real
//   invocation is replaced by the target program)
// - 1 configuration, validation or runtime failure
// - 2 usage/argument failure
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace rawiface::core::errors
