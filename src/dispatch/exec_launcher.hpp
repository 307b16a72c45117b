#pragma once

#include "dispatch/process_launcher.hpp"

#include <string>
#include <vector>

namespace rawiface::dispatch {

// Root-owned directories searched for the target program. The caller's PATH
// is never consulted.
std::vector<std::string> DefaultSearchDirectories();

// Replaces the current process with the resolved command via execv(2).
//
// The program is looked up in each search directory in order with execvp
// semantics: ENOENT, ENOTDIR and EACCES move on to the next directory, any
// other errno stops the search. argv[0] stays the bare program name. The
// environment and stdio are inherited unchanged.
class ExecLauncher final : public IProcessLauncher {
public:
  ExecLauncher();
  explicit ExecLauncher(std::vector<std::string> search_directories);

  bool Launch(const command::ResolvedCommand& command, core::errors::Error& error) override;

  const std::vector<std::string>& SearchDirectories() const {
    return search_directories_;
  }

private:
  std::vector<std::string> search_directories_;
};

} // namespace rawiface::dispatch
