#pragma once

#include "dispatch/process_launcher.hpp"

#include <filesystem>

namespace rawiface::cli {

// Collaborators Dispatch needs from the outside world. Production uses the
// fixed configuration path and the exec-based launcher; tests substitute a
// temporary configuration and a recording launcher.
struct DispatchContext {
  std::filesystem::path config_path;
  dispatch::IProcessLauncher* launcher = nullptr;
};

// Routes `rawiface` program subcommands and returns process exit codes:
//   0 => help/version/--dry-run printed successfully
//   1 => configuration, validation or dispatch failure (`ERROR: <message>`)
//   2 => usage error (unknown program/option, malformed arguments)
// On a successful real dispatch the process image is replaced and this never
// returns.
int Dispatch(int argc, char** argv, const DispatchContext& context);

// Dispatch with the production context.
int Dispatch(int argc, char** argv);

} // namespace rawiface::cli
