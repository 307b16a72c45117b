#include "rawiface/cli/router.hpp"

#include "command/invocation.hpp"
#include "core/errors/error.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "dispatch/exec_launcher.hpp"
#include "policy/denylist.hpp"
#include "rawiface/invocation_pipeline.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rawiface::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

constexpr std::string_view kVersion = "rawiface 0.1.0";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  rawiface [options] tcpdump <ifname> [--count <n>] [--timeout <seconds>]\n"
      << "  rawiface [options] tcpreplay <ifname>\n"
      << "  rawiface [options] ip <ifname> <up|down>\n"
      << "  rawiface [options] ethtool <change|set-eee|pause> <ifname> [args...]\n"
      << "  rawiface version\n"
      << "options:\n"
      << "  --debug                 print the failure chain and debug logs\n"
      << "  --log-level <level>     debug|info|warn|error (default: warn)\n"
      << "  --dry-run               print the resolved command instead of running it\n";
}

struct GlobalOptions {
  bool debug = false;
  bool dry_run = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kWarn;
  bool has_log_level = false;
};

int UsageError(std::string_view message) {
  std::cerr << "error: " << message << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

// Accepts "--name value" and "--name=value". Returns false when `token` is not
// the option at all; sets `error` when it is but the value is missing.
bool MatchOptionValue(const std::vector<std::string_view>& args, std::size_t& i,
                      std::string_view name, std::string_view& value, std::string& error) {
  const std::string_view token = args[i];
  if (token == name) {
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(name);
      return true;
    }
    value = args[++i];
    return true;
  }
  if (token.size() > name.size() && token.substr(0, name.size()) == name &&
      token[name.size()] == '=') {
    value = token.substr(name.size() + 1);
    return true;
  }
  return false;
}

bool ParsePositiveInteger(std::string_view raw, std::string_view option, std::uint64_t& value,
                          std::string& error) {
  std::uint64_t parsed = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (raw.empty() || ec != std::errc() || ptr != end || parsed == 0U) {
    error = std::string(option) + " must be a positive integer, got '" + std::string(raw) + "'";
    return false;
  }
  value = parsed;
  return true;
}

// Parse `tcpdump` args:
// - exactly one interface name
// - optional `--count <n>` and `--timeout <seconds>`
bool ParseTcpdumpArgs(const std::vector<std::string_view>& args,
                      command::InvocationRequest& request, std::string& error) {
  bool has_interface = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view value;
    if (MatchOptionValue(args, i, "--count", value, error)) {
      if (!error.empty()) {
        return false;
      }
      std::uint64_t count = 0;
      if (!ParsePositiveInteger(value, "--count", count, error)) {
        return false;
      }
      request.capture.count = count;
      continue;
    }
    if (MatchOptionValue(args, i, "--timeout", value, error)) {
      if (!error.empty()) {
        return false;
      }
      std::uint64_t timeout = 0;
      if (!ParsePositiveInteger(value, "--timeout", timeout, error)) {
        return false;
      }
      request.capture.timeout_seconds = timeout;
      continue;
    }

    const std::string_view token = args[i];
    if (!token.empty() && token.front() == '-') {
      error = "unknown option for tcpdump: " + std::string(token);
      return false;
    }
    if (has_interface) {
      error = "tcpdump accepts exactly 1 interface name";
      return false;
    }
    request.interface_name = std::string(token);
    has_interface = true;
  }

  if (!has_interface) {
    error = "tcpdump requires an interface name";
    return false;
  }
  return true;
}

bool ParseTcpreplayArgs(const std::vector<std::string_view>& args,
                        command::InvocationRequest& request, std::string& error) {
  if (args.size() != 1U) {
    error = "tcpreplay requires exactly 1 argument: <ifname>";
    return false;
  }
  if (!args.front().empty() && args.front().front() == '-') {
    error = "unknown option for tcpreplay: " + std::string(args.front());
    return false;
  }
  request.interface_name = std::string(args.front());
  return true;
}

bool ParseIpArgs(const std::vector<std::string_view>& args, command::InvocationRequest& request,
                 std::string& error) {
  if (args.size() != 2U) {
    error = "ip requires exactly 2 arguments: <ifname> <up|down>";
    return false;
  }
  if (!args[0].empty() && args[0].front() == '-') {
    error = "unknown option for ip: " + std::string(args[0]);
    return false;
  }

  core::errors::Error action_error;
  if (!command::ParseLinkAction(args[1], request.link.action, action_error)) {
    error = action_error.message;
    return false;
  }
  request.interface_name = std::string(args[0]);
  return true;
}

// Parse `ethtool <subcommand> <ifname> [args...]`. Tokens after the interface
// name are collected verbatim, options included; rejecting them is the
// argument sanitizer's job, not the parser's.
bool ParseEthtoolArgs(const std::vector<std::string_view>& args,
                      command::InvocationRequest& request, std::string& error) {
  if (args.size() < 2U) {
    error = "ethtool requires a subcommand (change|set-eee|pause) and an interface name";
    return false;
  }

  core::errors::Error subcommand_error;
  if (!command::ParseNicTuneCommand(args[0], request.nic_tune.command, subcommand_error)) {
    error = subcommand_error.message;
    return false;
  }
  if (!args[1].empty() && args[1].front() == '-') {
    error = "unknown option for ethtool " + std::string(args[0]) + ": " + std::string(args[1]);
    return false;
  }

  request.interface_name = std::string(args[1]);
  for (std::size_t i = 2; i < args.size(); ++i) {
    request.nic_tune.args.emplace_back(args[i]);
  }
  return true;
}

bool ParseProgramArgs(const std::vector<std::string_view>& args,
                      command::InvocationRequest& request, std::string& error) {
  switch (request.program) {
  case command::Program::kTcpdump:
    return ParseTcpdumpArgs(args, request, error);
  case command::Program::kTcpreplay:
    return ParseTcpreplayArgs(args, request, error);
  case command::Program::kIp:
    return ParseIpArgs(args, request, error);
  case command::Program::kEthtool:
    return ParseEthtoolArgs(args, request, error);
  }

  error = "invalid program";
  return false;
}

int ReportFailure(const core::errors::Error& error, const GlobalOptions& options,
                  core::logging::Logger& logger) {
  logger.Debug("invocation rejected", {{"category", core::errors::ToString(error.category)}});
  if (options.debug) {
    std::cerr << core::errors::FormatFailureChain(error);
  }
  std::cerr << "ERROR: " << error.message << '\n';
  return kExitFailure;
}

} // namespace

int Dispatch(int argc, char** argv, const DispatchContext& context) {
  const std::vector<std::string_view> tokens(argv + (argc > 0 ? 1 : 0), argv + argc);

  GlobalOptions options;
  std::size_t index = 0;
  for (; index < tokens.size(); ++index) {
    const std::string_view token = tokens[index];
    if (token == "--debug") {
      options.debug = true;
      continue;
    }
    if (token == "--dry-run") {
      options.dry_run = true;
      continue;
    }
    if (token == "--help" || token == "-h") {
      PrintUsage(std::cout);
      return kExitSuccess;
    }
    std::string_view value;
    std::string error;
    if (MatchOptionValue(tokens, index, "--log-level", value, error)) {
      if (!error.empty()) {
        return UsageError(error);
      }
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return UsageError(error);
      }
      options.has_log_level = true;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      return UsageError("unknown option: " + std::string(token));
    }
    break;
  }

  if (index >= tokens.size()) {
    return UsageError("missing program");
  }

  const std::string_view program_name = tokens[index];
  const std::vector<std::string_view> args(tokens.begin() + static_cast<std::ptrdiff_t>(index) + 1,
                                           tokens.end());

  if (program_name == "help") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }
  if (program_name == "version") {
    if (!args.empty()) {
      return UsageError("version does not accept arguments");
    }
    std::cout << kVersion << '\n';
    return kExitSuccess;
  }

  core::logging::Logger logger(options.debug && !options.has_log_level
                                   ? core::logging::LogLevel::kDebug
                                   : options.log_level,
                               std::string(program_name));

  command::InvocationRequest request;
  core::errors::Error error;
  if (!command::ParseProgram(program_name, request.program, error)) {
    return UsageError(error.message);
  }

  std::string parse_error;
  if (!ParseProgramArgs(args, request, parse_error)) {
    return UsageError(parse_error);
  }

  if (options.dry_run) {
    command::ResolvedCommand resolved;
    if (!ResolveInvocation(request, context.config_path, logger, resolved, error)) {
      return ReportFailure(error, options, logger);
    }
    std::cout << command::FormatCommandLine(resolved) << '\n';
    return kExitSuccess;
  }

  if (context.launcher == nullptr) {
    error.category = core::errors::ErrorCategory::kRuntime;
    error.message = "no process launcher configured";
    return ReportFailure(error, options, logger);
  }
  if (!ExecuteInvocation(request, context.config_path, *context.launcher, logger, error)) {
    return ReportFailure(error, options, logger);
  }

  // Only a test launcher returns after a successful launch.
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  dispatch::ExecLauncher launcher;
  DispatchContext context;
  context.config_path = policy::kDefaultConfigPath;
  context.launcher = &launcher;
  return Dispatch(argc, argv, context);
}

} // namespace rawiface::cli
