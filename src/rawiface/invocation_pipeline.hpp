#pragma once

#include "command/invocation.hpp"
#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "dispatch/process_launcher.hpp"

#include <filesystem>

namespace rawiface {

// Load denylist -> validate interface -> sanitize/build. Pure: reads the
// configuration file and nothing else.
//
// The configuration is loaded before the interface name is looked at, so a
// broken or unreadable configuration is always reported as such, whatever
// the request contains.
bool ResolveInvocation(const command::InvocationRequest& request,
                       const std::filesystem::path& config_path,
                       core::logging::Logger& logger,
                       command::ResolvedCommand& resolved,
                       core::errors::Error& error);

// ResolveInvocation followed by `launcher.Launch`. This is the only path in
// the program that reaches a launcher, so nothing is executed unless every
// check above passed.
bool ExecuteInvocation(const command::InvocationRequest& request,
                       const std::filesystem::path& config_path,
                       dispatch::IProcessLauncher& launcher,
                       core::logging::Logger& logger,
                       core::errors::Error& error);

} // namespace rawiface
