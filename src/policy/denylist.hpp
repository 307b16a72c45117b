#pragma once

#include "core/errors/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rawiface::policy {

// Loopback is always denied, whatever the configuration says.
inline constexpr std::string_view kLoopbackInterface = "lo";

// Fixed, root-owned configuration location. Deliberately not overridable from
// the command line: the caller runs unprivileged and must not choose policy.
inline constexpr std::string_view kDefaultConfigPath = "/etc/rawiface/config.yaml";

// Interface names the wrapper refuses to touch, in configuration order with
// duplicates removed.
class Denylist {
public:
  Denylist() = default;

  // Appends `name` unless already present.
  void Add(std::string name);

  bool Contains(std::string_view name) const;

  const std::vector<std::string>& Names() const {
    return names_;
  }

  std::size_t Size() const {
    return names_.size();
  }

private:
  std::vector<std::string> names_;
};

// Parses YAML text and extracts `raw-interface.denied-interfaces`.
//
// Contract:
// - Returns false with ErrorCategory::kConfiguration when the text is not
//   valid YAML, the root or `raw-interface` is not a mapping, or
//   `denied-interfaces` exists but is not a list of scalars.
// - An absent section/key or an empty document yields an empty configured
//   list.
// - On success `denylist` always contains kLoopbackInterface as its last entry
//   unless the configuration already listed it.
bool ParseDenylist(std::string_view yaml_text, Denylist& denylist, core::errors::Error& error);

// Reads `config_path` and applies ParseDenylist. A missing or unreadable file
// is a configuration failure. No caching: every call reads the file.
bool LoadDenylist(const std::filesystem::path& config_path, Denylist& denylist,
                  core::errors::Error& error);

} // namespace rawiface::policy
