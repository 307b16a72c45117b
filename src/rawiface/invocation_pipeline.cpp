#include "rawiface/invocation_pipeline.hpp"

#include "command/command_builder.hpp"
#include "policy/denylist.hpp"
#include "policy/interface_validator.hpp"

#include <string>
#include <utility>

namespace rawiface {

bool ResolveInvocation(const command::InvocationRequest& request,
                       const std::filesystem::path& config_path,
                       core::logging::Logger& logger,
                       command::ResolvedCommand& resolved,
                       core::errors::Error& error) {
  using core::errors::AddContext;

  resolved = command::ResolvedCommand{};
  const std::string program = command::ToString(request.program);

  policy::Denylist denylist;
  if (!policy::LoadDenylist(config_path, denylist, error)) {
    return AddContext(error, "loading denylist from " + config_path.string());
  }
  logger.Debug("denylist loaded", {{"config_path", config_path.string()},
                                   {"denied_count", std::to_string(denylist.Size())}});

  if (!policy::ValidateInterfaceName(request.interface_name, denylist, error)) {
    return AddContext(error, "validating interface name for " + program);
  }
  logger.Debug("interface accepted", {{"interface", request.interface_name}});

  command::ResolvedCommand built;
  if (!command::BuildCommand(request, built, error)) {
    return AddContext(error, "building " + program + " command");
  }

  resolved = std::move(built);
  logger.Debug("command resolved", {{"argv", command::FormatCommandLine(resolved)}});
  return true;
}

bool ExecuteInvocation(const command::InvocationRequest& request,
                       const std::filesystem::path& config_path,
                       dispatch::IProcessLauncher& launcher,
                       core::logging::Logger& logger,
                       core::errors::Error& error) {
  command::ResolvedCommand resolved;
  if (!ResolveInvocation(request, config_path, logger, resolved, error)) {
    return false;
  }

  logger.Info("dispatching", {{"argv", command::FormatCommandLine(resolved)}});
  if (!launcher.Launch(resolved, error)) {
    return core::errors::AddContext(error, "dispatching " + resolved.ProgramName());
  }
  return true;
}

} // namespace rawiface
