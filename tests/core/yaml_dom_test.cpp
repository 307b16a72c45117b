#include "core/yaml_dom.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

using rawiface::core::yaml::Value;

Value ParseOrFail(const std::string& text) {
  Value root;
  std::string error;
  const bool ok = rawiface::core::yaml::Parse(text, root, error);
  INFO(error);
  REQUIRE(ok);
  return root;
}

std::string ParseError(const std::string& text) {
  Value root;
  std::string error;
  REQUIRE_FALSE(rawiface::core::yaml::Parse(text, root, error));
  return error;
}

} // namespace

TEST_CASE("YAML nested mappings and block sequences", "[core][yaml]") {
  const Value root = ParseOrFail("# policy\n"
                                 "raw-interface:\n"
                                 "  denied-interfaces:\n"
                                 "    - eth0   # uplink\n"
                                 "    - 'bond0'\n"
                                 "    - \"br-mgmt\"\n"
                                 "  other: value\n");

  REQUIRE(root.type == Value::Type::kMapping);
  const Value& section = root.mapping_value.at("raw-interface");
  REQUIRE(section.type == Value::Type::kMapping);
  REQUIRE(section.mapping_value.at("other").scalar_value == "value");

  const Value& denied = section.mapping_value.at("denied-interfaces");
  REQUIRE(denied.type == Value::Type::kSequence);
  REQUIRE(denied.sequence_value.size() == 3U);
  REQUIRE(denied.sequence_value[0].scalar_value == "eth0");
  REQUIRE(denied.sequence_value[1].scalar_value == "bond0");
  REQUIRE(denied.sequence_value[2].scalar_value == "br-mgmt");
}

TEST_CASE("YAML sequence may sit at the parent key indentation", "[core][yaml]") {
  const Value root = ParseOrFail("raw-interface:\n"
                                 "  denied-interfaces:\n"
                                 "  - eth0\n"
                                 "  - eth1\n"
                                 "  trailing: 1\n");

  const Value& section = root.mapping_value.at("raw-interface");
  const Value& denied = section.mapping_value.at("denied-interfaces");
  REQUIRE(denied.type == Value::Type::kSequence);
  REQUIRE(denied.sequence_value.size() == 2U);
  REQUIRE(section.mapping_value.at("trailing").scalar_value == "1");
}

TEST_CASE("YAML flow sequences and null values", "[core][yaml]") {
  const Value root = ParseOrFail("---\n"
                                 "a: [eth0, \"eth1\", 'eth:2']\n"
                                 "b: []\n"
                                 "c:\n"
                                 "d: ~\n"
                                 "e: null\n");

  const Value& a = root.mapping_value.at("a");
  REQUIRE(a.type == Value::Type::kSequence);
  REQUIRE(a.sequence_value.size() == 3U);
  REQUIRE(a.sequence_value[2].scalar_value == "eth:2");
  REQUIRE(root.mapping_value.at("b").sequence_value.empty());
  REQUIRE(root.mapping_value.at("c").type == Value::Type::kNull);
  REQUIRE(root.mapping_value.at("d").type == Value::Type::kNull);
  REQUIRE(root.mapping_value.at("e").type == Value::Type::kNull);
}

TEST_CASE("YAML compact mappings inside sequences", "[core][yaml]") {
  const Value root = ParseOrFail("items:\n"
                                 "  - name: eth0\n"
                                 "    mtu: 9000\n"
                                 "  - name: eth1\n");

  const Value& items = root.mapping_value.at("items");
  REQUIRE(items.sequence_value.size() == 2U);
  REQUIRE(items.sequence_value[0].mapping_value.at("mtu").scalar_value == "9000");
  REQUIRE(items.sequence_value[1].mapping_value.at("name").scalar_value == "eth1");
}

TEST_CASE("YAML empty and comment-only documents are null", "[core][yaml]") {
  REQUIRE(ParseOrFail("").type == Value::Type::kNull);
  REQUIRE(ParseOrFail("# nothing here\n\n").type == Value::Type::kNull);
}

TEST_CASE("YAML leading byte-order mark is skipped", "[core][yaml]") {
  const Value root = ParseOrFail("\xEF\xBB\xBFraw-interface:\n"
                                 "  denied-interfaces:\n"
                                 "    - eth0\n");

  REQUIRE(root.mapping_value.count("raw-interface") == 1U);
  const Value& denied = root.mapping_value.at("raw-interface").mapping_value.at("denied-interfaces");
  REQUIRE(denied.sequence_value.size() == 1U);
  REQUIRE(denied.sequence_value[0].scalar_value == "eth0");
}

TEST_CASE("YAML apostrophe inside a plain scalar does not hide a comment", "[core][yaml]") {
  const Value root = ParseOrFail("notes:\n"
                                 "  - don't # trailing\n"
                                 "  - 'it''s' # quoted\n");

  const Value& notes = root.mapping_value.at("notes");
  REQUIRE(notes.sequence_value.size() == 2U);
  REQUIRE(notes.sequence_value[0].scalar_value == "don't");
  REQUIRE(notes.sequence_value[1].scalar_value == "it's");
}

TEST_CASE("YAML rejects malformed or unsupported input with line numbers", "[core][yaml]") {
  REQUIRE(ParseError("a: 1\n  b: 2\n").find("line 2") != std::string::npos);
  REQUIRE(ParseError("a: [eth0, eth1\n").find("unterminated flow sequence") != std::string::npos);
  REQUIRE(ParseError("a: \"open\n").find("unterminated quoted string") != std::string::npos);
  REQUIRE(ParseError("a: 1\na: 2\n").find("duplicate mapping key") != std::string::npos);
  REQUIRE(ParseError("a: &anchor x\n").find("anchors") != std::string::npos);
  REQUIRE(ParseError("a: |\n  text\n").find("block scalars") != std::string::npos);
  REQUIRE(ParseError("a: {b: 1}\n").find("flow mappings") != std::string::npos);
  REQUIRE(ParseError("a: 1\n---\nb: 2\n").find("multiple documents") != std::string::npos);
  REQUIRE(ParseError("a:\n\t- x\n").find("tab") != std::string::npos);
  REQUIRE(ParseError("a: b: c\n").find("mapping values are not allowed") != std::string::npos);
}
