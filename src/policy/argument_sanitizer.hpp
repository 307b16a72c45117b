#pragma once

#include "core/errors/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rawiface::policy {

// Letters, digits, '-', '/' and ':'. Nothing a shell or ethtool's own option
// parser could read as a separator or a new flag.
bool IsAllowedArgumentCharacter(char c);

// Checks one token forwarded verbatim to ethtool. Rejects empty tokens, tokens
// starting with '-' (no smuggled options) and any character outside the
// allowed set.
bool SanitizeArgument(std::string_view token, core::errors::Error& error);

// Applies SanitizeArgument to every token; the first rejection wins. The
// tokens are never rewritten: they either pass unchanged or the call fails.
bool SanitizeArguments(const std::vector<std::string>& tokens, core::errors::Error& error);

} // namespace rawiface::policy
