#pragma once

#include "core/errors/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rawiface::command {

// Closed set of programs the wrapper can ever exec. Adding one means adding a
// case to every switch over this enum.
enum class Program {
  kTcpdump,
  kTcpreplay,
  kIp,
  kEthtool,
};

enum class LinkAction {
  kUp,
  kDown,
};

enum class NicTuneCommand {
  kChange,
  kSetEee,
  kPause,
};

// Executable name, which is also argv[0] of the resolved command.
const char* ToString(Program program);
const char* ToString(LinkAction action);
const char* ToString(NicTuneCommand command);

// Textual lookups used by the CLI. Unknown names are configuration failures
// ("invalid program") or validation failures (actions and subcommands).
bool ParseProgram(std::string_view raw, Program& program, core::errors::Error& error);
bool ParseLinkAction(std::string_view raw, LinkAction& action, core::errors::Error& error);
bool ParseNicTuneCommand(std::string_view raw, NicTuneCommand& command,
                         core::errors::Error& error);

struct CaptureOptions {
  std::optional<std::uint64_t> count;
  std::optional<std::uint64_t> timeout_seconds;
};

struct LinkOptions {
  LinkAction action = LinkAction::kUp;
};

struct NicTuneOptions {
  NicTuneCommand command = NicTuneCommand::kChange;
  std::vector<std::string> args;
};

// Everything the CLI collected for one invocation. Only the options block
// matching `program` is read.
struct InvocationRequest {
  Program program = Program::kTcpdump;
  std::string interface_name;
  CaptureOptions capture;
  LinkOptions link;
  NicTuneOptions nic_tune;
};

// Program name followed by its arguments, ready for exec.
struct ResolvedCommand {
  std::vector<std::string> argv;

  const std::string& ProgramName() const {
    return argv.front();
  }
};

// Renders argv as one line, single-quoting any token that is not made of
// plain word characters. Used for --dry-run output and debug logs.
std::string FormatCommandLine(const ResolvedCommand& command);

} // namespace rawiface::command
