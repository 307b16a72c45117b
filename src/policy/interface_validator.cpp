#include "policy/interface_validator.hpp"

#include <cctype>
#include <string>

namespace rawiface::policy {

namespace {

bool IsForbiddenNameCharacter(char c) {
  return c == '/' || std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool ValidateInterfaceName(std::string_view name, const Denylist& denylist,
                           core::errors::Error& error) {
  using core::errors::ValidationFailure;

  if (name.empty()) {
    return ValidationFailure(error, "empty interface name");
  }

  for (const char c : name) {
    if (IsForbiddenNameCharacter(c)) {
      return ValidationFailure(error, "interface name must not contain '/' or whitespace: '" +
                                          std::string(name) + "'");
    }
  }

  if (name.size() > kMaxInterfaceNameLength) {
    return ValidationFailure(error, "interface name longer than " +
                                        std::to_string(kMaxInterfaceNameLength) +
                                        " characters: '" + std::string(name) + "'");
  }

  if (denylist.Contains(name)) {
    return ValidationFailure(error, "interface '" + std::string(name) + "' is denied by policy");
  }

  return true;
}

} // namespace rawiface::policy
