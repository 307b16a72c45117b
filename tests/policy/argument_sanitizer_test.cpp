#include "policy/argument_sanitizer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using rawiface::core::errors::Error;
using rawiface::core::errors::ErrorCategory;

TEST_CASE("Typical ethtool arguments pass unchanged", "[policy][sanitizer]") {
  const std::vector<std::string> args = {"speed", "1000", "duplex", "full", "autoneg", "off",
                                         "advertise", "0x-not-hex", "msglvl", "drv:on",
                                         "wol", "p/u"};
  Error error;
  REQUIRE(rawiface::policy::SanitizeArguments(args, error));
  REQUIRE(args.size() == 12U);
}

TEST_CASE("Empty argument list is allowed", "[policy][sanitizer]") {
  Error error;
  REQUIRE(rawiface::policy::SanitizeArguments({}, error));
}

TEST_CASE("Arguments starting with a hyphen are rejected", "[policy][sanitizer]") {
  Error error;
  for (const std::string token : {"--set-ring", "-s", "-", "--"}) {
    INFO(token);
    REQUIRE_FALSE(rawiface::policy::SanitizeArguments({"rx", token}, error));
    REQUIRE(error.category == ErrorCategory::kValidation);
    REQUIRE(error.message.find("must not start with '-'") != std::string::npos);
  }

  // Hyphens elsewhere in the token are fine.
  REQUIRE(rawiface::policy::SanitizeArguments({"rx-usecs", "a-"}, error));
}

TEST_CASE("Characters outside the allowed set are rejected", "[policy][sanitizer]") {
  Error error;
  for (const std::string token :
       {"rx;1000", "a b", "$(id)", "`id`", "a|b", "a&b", "a>b", "x=1", "a.b", "a_b", "a,b",
        "a\nb", "\xc3\xa9"}) {
    INFO(token);
    REQUIRE_FALSE(rawiface::policy::SanitizeArgument(token, error));
    REQUIRE(error.category == ErrorCategory::kValidation);
    REQUIRE(error.message.find("disallowed characters") != std::string::npos);
  }
}

TEST_CASE("Empty arguments are rejected", "[policy][sanitizer]") {
  Error error;
  REQUIRE_FALSE(rawiface::policy::SanitizeArguments({"autoneg", ""}, error));
  REQUIRE(error.category == ErrorCategory::kValidation);
}

TEST_CASE("First rejected argument is reported", "[policy][sanitizer]") {
  Error error;
  REQUIRE_FALSE(rawiface::policy::SanitizeArguments({"ok", "bad;one", "--worse"}, error));
  REQUIRE(error.message.find("bad;one") != std::string::npos);
}
