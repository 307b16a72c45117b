#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/config_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace common = rawiface::tests::common;

namespace {

// Every rejection must exit 1 with a single ERROR line and never reach the
// launcher.
void AssertRejected(const std::vector<std::string>& argv_storage,
                    const std::filesystem::path& config_path, std::string_view expected_message) {
  common::RecordingLauncher launcher;
  const common::DispatchOutcome outcome =
      common::DispatchCaptured(argv_storage, config_path, &launcher);

  common::AssertExitCode(outcome.exit_code, 1, expected_message);
  common::AssertContains(outcome.stderr_text, "ERROR: ");
  common::AssertContains(outcome.stderr_text, expected_message);
  common::AssertNotContains(outcome.stderr_text, "failure chain");
  if (launcher.launch_count != 0) {
    common::Fail("launcher reached for rejected invocation");
  }
}

} // namespace

int main() {
  common::ScopedTempDir temp("rawiface-rejection");
  const auto config_path = temp.Path() / "config.yaml";
  common::WriteFixtureFile(config_path, common::kDenyEth0Config);

  const auto empty_config = temp.Path() / "empty.yaml";
  common::WriteFixtureFile(empty_config, "raw-interface:\n  denied-interfaces: []\n");

  // Denylist membership, loopback included even when nothing is configured.
  AssertRejected({"rawiface", "ip", "eth0", "down"}, config_path, "denied by policy");
  AssertRejected({"rawiface", "tcpdump", "mgmt0"}, config_path, "denied by policy");
  AssertRejected({"rawiface", "tcpreplay", "lo"}, config_path, "denied by policy");
  AssertRejected({"rawiface", "tcpreplay", "lo"}, empty_config, "denied by policy");

  // Interface name syntax.
  AssertRejected({"rawiface", "ip", "", "up"}, config_path, "empty interface name");
  AssertRejected({"rawiface", "tcpdump", "../eth1"}, config_path, "'/' or whitespace");
  AssertRejected({"rawiface", "tcpdump", "eth1 -w /tmp/x"}, empty_config, "'/' or whitespace");
  AssertRejected({"rawiface", "tcpdump", "abcdefghijklmnopq"}, config_path, "longer than 16");

  // ethtool trailing arguments.
  AssertRejected({"rawiface", "ethtool", "change", "eth1", "--set-ring"}, config_path,
                 "must not start with '-'");
  AssertRejected({"rawiface", "ethtool", "change", "eth1", "rx;1000"}, config_path,
                 "disallowed characters");
  AssertRejected({"rawiface", "ethtool", "pause", "eth1", "autoneg", "$(reboot)"}, config_path,
                 "disallowed characters");
  AssertRejected({"rawiface", "ethtool", "set-eee", "eth1", "-s"}, config_path,
                 "must not start with '-'");

  // Launch failure after successful validation.
  {
    common::RecordingLauncher launcher;
    launcher.fail_with_missing_binary = true;
    const common::DispatchOutcome outcome =
        common::DispatchCaptured({"rawiface", "tcpreplay", "eth1"}, config_path, &launcher);
    common::AssertExitCode(outcome.exit_code, 1, "missing binary");
    common::AssertContains(outcome.stderr_text, "ERROR: missing binary: tcpreplay");
  }

  std::cout << "rejection_smoke: ok\n";
  return 0;
}
