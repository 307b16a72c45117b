#include "dispatch/exec_launcher.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace rawiface::dispatch {

std::vector<std::string> DefaultSearchDirectories() {
  return {"/usr/local/sbin", "/usr/local/bin", "/usr/sbin", "/usr/bin", "/sbin", "/bin"};
}

ExecLauncher::ExecLauncher() : search_directories_(DefaultSearchDirectories()) {}

ExecLauncher::ExecLauncher(std::vector<std::string> search_directories)
    : search_directories_(std::move(search_directories)) {}

bool ExecLauncher::Launch(const command::ResolvedCommand& command, core::errors::Error& error) {
  if (command.argv.empty()) {
    return core::errors::RuntimeFailure(error, "missing binary: empty command");
  }
  const std::string& program = command.ProgramName();
  if (program.find('/') != std::string::npos) {
    return core::errors::RuntimeFailure(error, "missing binary: program must be a bare name: " +
                                                   program);
  }

  std::vector<char*> exec_argv;
  exec_argv.reserve(command.argv.size() + 1U);
  for (const std::string& token : command.argv) {
    exec_argv.push_back(const_cast<char*>(token.c_str()));
  }
  exec_argv.push_back(nullptr);

  // Anything still buffered would be lost with the old process image.
  std::cout.flush();
  std::cerr.flush();

  int last_errno = ENOENT;
  bool saw_eacces = false;
  for (const std::string& directory : search_directories_) {
    if (directory.empty()) {
      continue;
    }
    const std::string candidate =
        directory.back() == '/' ? directory + program : directory + "/" + program;

    ::execv(candidate.c_str(), exec_argv.data());

    last_errno = errno;
    if (last_errno == EACCES) {
      saw_eacces = true;
      continue;
    }
    if (last_errno == ENOENT || last_errno == ENOTDIR) {
      continue;
    }
    return core::errors::RuntimeFailure(error, "missing binary: " + program + " (" +
                                                   candidate + ": " + std::strerror(last_errno) +
                                                   ")");
  }

  if (saw_eacces) {
    last_errno = EACCES;
  }
  return core::errors::RuntimeFailure(error, "missing binary: " + program + " (" +
                                                 std::strerror(last_errno) + ")");
}

} // namespace rawiface::dispatch
