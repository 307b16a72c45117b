#include "command/command_builder.hpp"

#include "policy/argument_sanitizer.hpp"

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace rawiface::command {

namespace {

using core::errors::Error;

constexpr std::array<NicTuneRule, 3> kNicTuneRules = {{
    {NicTuneCommand::kChange, "--change"},
    {NicTuneCommand::kSetEee, "--set-eee"},
    {NicTuneCommand::kPause, "--pause"},
}};

bool BuildTcpdump(const InvocationRequest& request, std::vector<std::string>& argv,
                  Error& error) {
  argv = {
      ToString(Program::kTcpdump),
      "-n",
      "--interface=" + request.interface_name,
      "--packet-buffered",
      "--snapshot-length=0",
      "-w",
      "-",
  };

  if (request.capture.count.has_value()) {
    if (request.capture.count.value() == 0U) {
      return core::errors::ValidationFailure(error, "capture count must be greater than 0");
    }
    argv.push_back("-c");
    argv.push_back(std::to_string(request.capture.count.value()));
  }

  // tcpdump has no timeout flag: rotate the dump after N seconds and keep at
  // most one file, which ends the capture when the first rotation is due.
  if (request.capture.timeout_seconds.has_value()) {
    if (request.capture.timeout_seconds.value() == 0U) {
      return core::errors::ValidationFailure(error, "capture timeout must be greater than 0");
    }
    argv.push_back("-G");
    argv.push_back(std::to_string(request.capture.timeout_seconds.value()));
    argv.push_back("-W");
    argv.push_back("1");
  }
  return true;
}

void BuildTcpreplay(const InvocationRequest& request, std::vector<std::string>& argv) {
  argv = {
      ToString(Program::kTcpreplay),
      "--intf1=" + request.interface_name,
      "-",
  };
}

void BuildIp(const InvocationRequest& request, std::vector<std::string>& argv) {
  argv = {
      ToString(Program::kIp), "link", "set", "dev", request.interface_name,
      ToString(request.link.action),
  };
}

bool BuildEthtool(const InvocationRequest& request, std::vector<std::string>& argv,
                  Error& error) {
  const NicTuneRule* rule = FindNicTuneRule(request.nic_tune.command);
  if (rule == nullptr) {
    return core::errors::ConfigurationFailure(error, "invalid ethtool subcommand");
  }
  if (!policy::SanitizeArguments(request.nic_tune.args, error)) {
    return core::errors::AddContext(error, std::string("sanitizing ethtool ") +
                                               ToString(request.nic_tune.command) + " arguments");
  }

  argv = {
      ToString(Program::kEthtool),
      std::string(rule->flag),
      request.interface_name,
  };
  argv.insert(argv.end(), request.nic_tune.args.begin(), request.nic_tune.args.end());
  return true;
}

} // namespace

const NicTuneRule* FindNicTuneRule(NicTuneCommand command) {
  for (const NicTuneRule& rule : kNicTuneRules) {
    if (rule.command == command) {
      return &rule;
    }
  }
  return nullptr;
}

bool BuildCommand(const InvocationRequest& request, ResolvedCommand& command, Error& error) {
  std::vector<std::string> argv;

  switch (request.program) {
  case Program::kTcpdump:
    if (!BuildTcpdump(request, argv, error)) {
      return false;
    }
    break;
  case Program::kTcpreplay:
    BuildTcpreplay(request, argv);
    break;
  case Program::kIp:
    BuildIp(request, argv);
    break;
  case Program::kEthtool:
    if (!BuildEthtool(request, argv, error)) {
      return false;
    }
    break;
  }

  if (argv.empty()) {
    return core::errors::ConfigurationFailure(error, "invalid program");
  }
  command.argv = std::move(argv);
  return true;
}

} // namespace rawiface::command
