#include "policy/interface_validator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

using rawiface::core::errors::Error;
using rawiface::core::errors::ErrorCategory;
using rawiface::policy::Denylist;

Denylist MakeDenylist(const std::vector<std::string>& names) {
  Denylist denylist;
  for (const auto& name : names) {
    denylist.Add(name);
  }
  denylist.Add("lo");
  return denylist;
}

} // namespace

TEST_CASE("Ordinary interface names are accepted", "[policy][interface]") {
  const Denylist denylist = MakeDenylist({"eth0"});
  Error error;

  for (const std::string name : {"eth1", "enp3s0f1", "wlan0", "veth-a1b2", "eth0.100", "br_lab",
                                 "abcdefghijklmnop"}) {
    INFO(name);
    REQUIRE(rawiface::policy::ValidateInterfaceName(name, denylist, error));
  }
}

TEST_CASE("Empty interface name is rejected first", "[policy][interface]") {
  Error error;
  REQUIRE_FALSE(rawiface::policy::ValidateInterfaceName("", MakeDenylist({}), error));
  REQUIRE(error.category == ErrorCategory::kValidation);
  REQUIRE(error.message == "empty interface name");
}

TEST_CASE("Path separators and whitespace are rejected regardless of denylist",
          "[policy][interface]") {
  const Denylist empty = MakeDenylist({});
  Error error;

  for (const std::string name : {"../eth0", "eth0/", "/dev/null", "eth 0", "eth0\t", "\neth0",
                                 "a\vb", "a\fb", "a\rb"}) {
    INFO(name);
    REQUIRE_FALSE(rawiface::policy::ValidateInterfaceName(name, empty, error));
    REQUIRE(error.category == ErrorCategory::kValidation);
    REQUIRE(error.message.find("'/' or whitespace") != std::string::npos);
  }
}

TEST_CASE("Names longer than sixteen characters are rejected", "[policy][interface]") {
  const Denylist empty = MakeDenylist({});
  Error error;

  REQUIRE(rawiface::policy::ValidateInterfaceName(std::string(16, 'e'), empty, error));
  for (const std::size_t length : {17U, 32U, 256U}) {
    REQUIRE_FALSE(rawiface::policy::ValidateInterfaceName(std::string(length, 'e'), empty, error));
    REQUIRE(error.category == ErrorCategory::kValidation);
    REQUIRE(error.message.find("longer than 16") != std::string::npos);
  }
}

TEST_CASE("Character rule wins over length rule", "[policy][interface]") {
  Error error;
  REQUIRE_FALSE(rawiface::policy::ValidateInterfaceName("this/name/is/far/too/long/anyway",
                                                        MakeDenylist({}), error));
  REQUIRE(error.message.find("'/' or whitespace") != std::string::npos);
}

TEST_CASE("Denied interfaces and loopback are rejected", "[policy][interface]") {
  const Denylist denylist = MakeDenylist({"eth0", "bond0"});
  Error error;

  for (const std::string name : {"eth0", "bond0", "lo"}) {
    INFO(name);
    REQUIRE_FALSE(rawiface::policy::ValidateInterfaceName(name, denylist, error));
    REQUIRE(error.category == ErrorCategory::kValidation);
    REQUIRE(error.message.find("denied by policy") != std::string::npos);
  }

  // Membership is exact, not prefix or case-insensitive.
  REQUIRE(rawiface::policy::ValidateInterfaceName("eth00", denylist, error));
  REQUIRE(rawiface::policy::ValidateInterfaceName("LO", denylist, error));
}
