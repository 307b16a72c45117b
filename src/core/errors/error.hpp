#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rawiface::core::errors {

// Every failure is terminal for the invocation. The category only decides how
// the failure is described; all of them exit with ExitCode::kFailure.
enum class ErrorCategory {
  kConfiguration,
  kValidation,
  kRuntime,
};

inline const char* ToString(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::kConfiguration:
    return "ConfigurationError";
  case ErrorCategory::kValidation:
    return "ValidationError";
  case ErrorCategory::kRuntime:
    return "RuntimeError";
  }

  return "RuntimeError";
}

// Failure value threaded through `bool Fn(..., Error& error)` calls.
//
// `context` records the stages the failure propagated through, innermost
// first. It is only rendered in --debug mode; the user-facing line is built
// from `message` alone.
struct Error {
  ErrorCategory category = ErrorCategory::kRuntime;
  std::string message;
  std::vector<std::string> context;

  void Clear() {
    category = ErrorCategory::kRuntime;
    message.clear();
    context.clear();
  }
};

inline bool Fail(Error& error, ErrorCategory category, std::string message) {
  error.category = category;
  error.message = std::move(message);
  error.context.clear();
  return false;
}

inline bool ConfigurationFailure(Error& error, std::string message) {
  return Fail(error, ErrorCategory::kConfiguration, std::move(message));
}

inline bool ValidationFailure(Error& error, std::string message) {
  return Fail(error, ErrorCategory::kValidation, std::move(message));
}

inline bool RuntimeFailure(Error& error, std::string message) {
  return Fail(error, ErrorCategory::kRuntime, std::move(message));
}

// Appends one propagation frame and keeps returning false so callers can write
// `return AddContext(error, "...");`.
inline bool AddContext(Error& error, std::string_view frame) {
  error.context.emplace_back(frame);
  return false;
}

// Multi-line failure chain for --debug, outermost stage first.
inline std::string FormatFailureChain(const Error& error) {
  std::string out = "failure chain (most recent stage last):\n";
  for (auto it = error.context.rbegin(); it != error.context.rend(); ++it) {
    out += "  in ";
    out += *it;
    out += '\n';
  }
  out += "  ";
  out += ToString(error.category);
  out += ": ";
  out += error.message;
  out += '\n';
  return out;
}

} // namespace rawiface::core::errors
