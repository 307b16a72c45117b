#pragma once

#include "core/errors/error.hpp"
#include "policy/denylist.hpp"

#include <cstddef>
#include <string_view>

namespace rawiface::policy {

// Kernel IFNAMSIZ bound used by the wrapper.
inline constexpr std::size_t kMaxInterfaceNameLength = 16;

// Checks a candidate interface name, first failure wins:
// 1. non-empty
// 2. no '/' and no whitespace
// 3. at most kMaxInterfaceNameLength characters
// 4. not in `denylist`
// All failures are ErrorCategory::kValidation. The name is never modified.
bool ValidateInterfaceName(std::string_view name, const Denylist& denylist,
                           core::errors::Error& error);

} // namespace rawiface::policy
