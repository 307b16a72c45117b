#include "policy/argument_sanitizer.hpp"

namespace rawiface::policy {

bool IsAllowedArgumentCharacter(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '/' || c == ':';
}

bool SanitizeArgument(std::string_view token, core::errors::Error& error) {
  using core::errors::ValidationFailure;

  if (token.empty()) {
    return ValidationFailure(error, "empty argument is not allowed");
  }
  if (token.front() == '-') {
    return ValidationFailure(error, "argument must not start with '-': '" + std::string(token) +
                                        "'");
  }
  for (const char c : token) {
    if (!IsAllowedArgumentCharacter(c)) {
      return ValidationFailure(error, "argument contains disallowed characters: '" +
                                          std::string(token) +
                                          "' (allowed: letters, digits, '-', '/', ':')");
    }
  }
  return true;
}

bool SanitizeArguments(const std::vector<std::string>& tokens, core::errors::Error& error) {
  for (const std::string& token : tokens) {
    if (!SanitizeArgument(token, error)) {
      return false;
    }
  }
  return true;
}

} // namespace rawiface::policy
