#include "command/invocation.hpp"

#include <initializer_list>
#include <string>

namespace rawiface::command {

const char* ToString(Program program) {
  switch (program) {
  case Program::kTcpdump:
    return "tcpdump";
  case Program::kTcpreplay:
    return "tcpreplay";
  case Program::kIp:
    return "ip";
  case Program::kEthtool:
    return "ethtool";
  }

  return "";
}

const char* ToString(LinkAction action) {
  switch (action) {
  case LinkAction::kUp:
    return "up";
  case LinkAction::kDown:
    return "down";
  }

  return "";
}

const char* ToString(NicTuneCommand command) {
  switch (command) {
  case NicTuneCommand::kChange:
    return "change";
  case NicTuneCommand::kSetEee:
    return "set-eee";
  case NicTuneCommand::kPause:
    return "pause";
  }

  return "";
}

bool ParseProgram(std::string_view raw, Program& program, core::errors::Error& error) {
  for (const Program candidate :
       {Program::kTcpdump, Program::kTcpreplay, Program::kIp, Program::kEthtool}) {
    if (raw == ToString(candidate)) {
      program = candidate;
      return true;
    }
  }
  return core::errors::ConfigurationFailure(error, "invalid program: '" + std::string(raw) + "'");
}

bool ParseLinkAction(std::string_view raw, LinkAction& action, core::errors::Error& error) {
  if (raw == "up") {
    action = LinkAction::kUp;
    return true;
  }
  if (raw == "down") {
    action = LinkAction::kDown;
    return true;
  }
  return core::errors::ValidationFailure(
      error, "invalid link action: '" + std::string(raw) + "' (expected up|down)");
}

bool ParseNicTuneCommand(std::string_view raw, NicTuneCommand& command,
                         core::errors::Error& error) {
  for (const NicTuneCommand candidate :
       {NicTuneCommand::kChange, NicTuneCommand::kSetEee, NicTuneCommand::kPause}) {
    if (raw == ToString(candidate)) {
      command = candidate;
      return true;
    }
  }
  return core::errors::ValidationFailure(
      error, "invalid ethtool subcommand: '" + std::string(raw) + "' (expected change|set-eee|pause)");
}

namespace {

bool IsShellWordCharacter(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '_' || c == '/' || c == ':' || c == '.' || c == '=' || c == ',' ||
         c == '+' || c == '@';
}

std::string QuoteToken(const std::string& token) {
  bool plain = !token.empty();
  for (const char c : token) {
    if (!IsShellWordCharacter(c)) {
      plain = false;
      break;
    }
  }
  if (plain) {
    return token;
  }

  std::string quoted = "'";
  for (const char c : token) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

} // namespace

std::string FormatCommandLine(const ResolvedCommand& command) {
  std::string line;
  for (const std::string& token : command.argv) {
    if (!line.empty()) {
      line.push_back(' ');
    }
    line += QuoteToken(token);
  }
  return line;
}

} // namespace rawiface::command
