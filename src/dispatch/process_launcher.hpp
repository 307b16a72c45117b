#pragma once

#include "command/invocation.hpp"
#include "core/errors/error.hpp"

namespace rawiface::dispatch {

// Terminal step of an invocation: hand the resolved command to the OS.
//
// Contract:
// - A real implementation never returns on success (the process image is
//   replaced). Returning true is only meaningful for test doubles.
// - Returns false with ErrorCategory::kRuntime when the program cannot be
//   located or executed.
class IProcessLauncher {
public:
  virtual ~IProcessLauncher() = default;

  virtual bool Launch(const command::ResolvedCommand& command, core::errors::Error& error) = 0;
};

} // namespace rawiface::dispatch
