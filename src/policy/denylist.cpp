#include "policy/denylist.hpp"

#include "core/fs_utils.hpp"
#include "core/yaml_dom.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace rawiface::policy {

namespace {

using core::errors::ConfigurationFailure;
using core::errors::Error;
using YamlValue = core::yaml::Value;

constexpr std::string_view kSectionKey = "raw-interface";
constexpr std::string_view kDeniedKey = "denied-interfaces";

} // namespace

void Denylist::Add(std::string name) {
  if (Contains(name)) {
    return;
  }
  names_.push_back(std::move(name));
}

bool Denylist::Contains(std::string_view name) const {
  return std::find(names_.begin(), names_.end(), name) != names_.end();
}

bool ParseDenylist(std::string_view yaml_text, Denylist& denylist, Error& error) {
  denylist = Denylist{};

  YamlValue root;
  std::string parse_error;
  if (!core::yaml::Parse(yaml_text, root, parse_error)) {
    return ConfigurationFailure(error, "invalid configuration: " + parse_error);
  }

  if (root.type != YamlValue::Type::kNull && root.type != YamlValue::Type::kMapping) {
    return ConfigurationFailure(error, std::string("invalid configuration: document root must be "
                                                   "a mapping, got ") +
                                           core::yaml::ToString(root.type));
  }

  const YamlValue* section = nullptr;
  if (root.type == YamlValue::Type::kMapping) {
    const auto it = root.mapping_value.find(std::string(kSectionKey));
    if (it != root.mapping_value.end()) {
      section = &it->second;
    }
  }

  const YamlValue* denied = nullptr;
  if (section != nullptr && section->type != YamlValue::Type::kNull) {
    if (section->type != YamlValue::Type::kMapping) {
      return ConfigurationFailure(error, std::string("invalid configuration: '") +
                                             std::string(kSectionKey) + "' must be a mapping, got " +
                                             core::yaml::ToString(section->type));
    }
    const auto it = section->mapping_value.find(std::string(kDeniedKey));
    if (it != section->mapping_value.end()) {
      denied = &it->second;
    }
  }

  // A present key must hold a list; `denied-interfaces:` with no value is null.
  if (denied != nullptr) {
    if (denied->type != YamlValue::Type::kSequence) {
      return ConfigurationFailure(error, std::string("invalid configuration: '") +
                                             std::string(kSectionKey) + "." +
                                             std::string(kDeniedKey) + "' must be a list, got " +
                                             core::yaml::ToString(denied->type));
    }
    for (std::size_t i = 0; i < denied->sequence_value.size(); ++i) {
      const YamlValue& entry = denied->sequence_value[i];
      if (entry.type != YamlValue::Type::kScalar) {
        return ConfigurationFailure(error, std::string("invalid configuration: '") +
                                               std::string(kSectionKey) + "." +
                                               std::string(kDeniedKey) + "[" + std::to_string(i) +
                                               "]' must be an interface name, got " +
                                               core::yaml::ToString(entry.type));
      }
      denylist.Add(entry.scalar_value);
    }
  }

  denylist.Add(std::string(kLoopbackInterface));
  return true;
}

bool LoadDenylist(const std::filesystem::path& config_path, Denylist& denylist, Error& error) {
  denylist = Denylist{};

  std::string contents;
  std::string read_error;
  if (!core::ReadRegularFile(config_path, contents, read_error)) {
    return ConfigurationFailure(error, "cannot read configuration: " + read_error);
  }

  if (!ParseDenylist(contents, denylist, error)) {
    return core::errors::AddContext(error, "parsing " + config_path.string());
  }
  return true;
}

} // namespace rawiface::policy
