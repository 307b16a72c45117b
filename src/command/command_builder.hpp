#pragma once

#include "command/invocation.hpp"
#include "core/errors/error.hpp"

#include <string_view>

namespace rawiface::command {

// One row of the ethtool table: CLI subcommand to the ethtool flag it maps to.
// Every row forwards its trailing arguments through the argument sanitizer.
struct NicTuneRule {
  NicTuneCommand command;
  std::string_view flag;
};

// Looks up the ethtool flag for `command`. Returns nullptr only for values
// outside the enum.
const NicTuneRule* FindNicTuneRule(NicTuneCommand command);

// Builds the fixed argv template for `request.program`.
//
// Preconditions: `request.interface_name` has already passed
// policy::ValidateInterfaceName. The ethtool branch sanitizes its trailing
// arguments itself, so no unchecked token can reach the output.
//
// Fails with ErrorCategory::kConfiguration ("invalid program") for a program
// value outside the enum and with kValidation for rejected ethtool arguments
// or out-of-range capture limits.
bool BuildCommand(const InvocationRequest& request, ResolvedCommand& command,
                  core::errors::Error& error);

} // namespace rawiface::command
