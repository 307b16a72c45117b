#ifndef RAWIFACE_CORE_YAML_DOM_HPP_
#define RAWIFACE_CORE_YAML_DOM_HPP_

#include <cctype>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rawiface::core::yaml {

// Minimal DOM for the rawiface configuration file. Every scalar is kept as
// text; callers decide how to interpret it.
struct Value {
  enum class Type {
    kMapping,
    kSequence,
    kScalar,
    kNull,
  };

  using Mapping = std::map<std::string, Value>;
  using Sequence = std::vector<Value>;

  Type type = Type::kNull;
  Mapping mapping_value;
  Sequence sequence_value;
  std::string scalar_value;
};

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kMapping:
    return "mapping";
  case Value::Type::kSequence:
    return "sequence";
  case Value::Type::kScalar:
    return "scalar";
  case Value::Type::kNull:
    return "null";
  }

  return "null";
}

// Indentation-driven YAML subset parser.
//
// Supported: block mappings, block sequences (including the "key:\n- item"
// form at the parent's indentation and "- key: value" compact mappings),
// flow sequences of scalars, plain/single-quoted/double-quoted scalars,
// `#` comments, `~`/`null`, one optional leading `---`.
// Anything else (anchors, aliases, tags, block scalars, flow mappings,
// multiple documents, tab indentation) is rejected with a line-numbered error
// instead of being guessed at.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    root = Value{};
    constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";
    if (input_.substr(0, kByteOrderMark.size()) == kByteOrderMark) {
      input_.remove_prefix(kByteOrderMark.size());
    }
    if (!SplitLines(error)) {
      return false;
    }
    if (lines_.empty()) {
      return true;
    }

    if (lines_.front().indent != 0U) {
      return Fail(lines_.front().number, "document must start at column 1", error);
    }
    if (!ParseBlock(root, error)) {
      return false;
    }
    if (pos_ < lines_.size()) {
      return Fail(lines_[pos_].number, "unexpected content after document root", error);
    }
    return true;
  }

private:
  struct Line {
    std::size_t number = 0;
    std::size_t indent = 0;
    std::string text;
  };

  static bool IsSequenceEntry(std::string_view text) {
    return !text.empty() && text.front() == '-' && (text.size() == 1U || text[1] == ' ');
  }

  static std::string_view TrimRight(std::string_view raw) {
    std::size_t end = raw.size();
    while (end > 0U && (raw[end - 1] == ' ' || raw[end - 1] == '\t' || raw[end - 1] == '\r')) {
      --end;
    }
    return raw.substr(0, end);
  }

  static std::string_view TrimLeft(std::string_view raw) {
    std::size_t begin = 0;
    while (begin < raw.size() && (raw[begin] == ' ' || raw[begin] == '\t')) {
      ++begin;
    }
    return raw.substr(begin);
  }

  // A quote opens a quoted scalar only where a token can start: line start,
  // after whitespace, or after a flow/mapping indicator.
  static bool StartsToken(std::string_view raw, std::size_t i) {
    if (i == 0U) {
      return true;
    }
    const char previous = raw[i - 1];
    return previous == ' ' || previous == '\t' || previous == '[' || previous == ',' ||
           previous == ':' || previous == '-';
  }

  // Removes a trailing `#` comment that sits outside quotes and is either at
  // the start of the line or preceded by whitespace.
  static std::string_view StripComment(std::string_view raw) {
    bool in_single = false;
    bool in_double = false;
    for (std::size_t i = 0; i < raw.size(); ++i) {
      const char c = raw[i];
      if (c == '\\' && in_double) {
        ++i;
        continue;
      }
      if (c == '\'' && !in_double) {
        if (in_single) {
          // '' is an escaped quote inside a single-quoted scalar.
          if (i + 1 < raw.size() && raw[i + 1] == '\'') {
            ++i;
          } else {
            in_single = false;
          }
        } else if (StartsToken(raw, i)) {
          in_single = true;
        }
      } else if (c == '"' && !in_single) {
        if (in_double || StartsToken(raw, i)) {
          in_double = !in_double;
        }
      } else if (c == '#' && !in_single && !in_double &&
                 (i == 0U || raw[i - 1] == ' ' || raw[i - 1] == '\t')) {
        return raw.substr(0, i);
      }
    }
    return raw;
  }

  bool SplitLines(std::string& error) {
    lines_.clear();
    bool saw_content = false;
    std::size_t number = 0;
    std::size_t start = 0;
    while (start <= input_.size()) {
      std::size_t end = input_.find('\n', start);
      if (end == std::string_view::npos) {
        end = input_.size();
      }
      ++number;
      const std::string_view raw = input_.substr(start, end - start);
      start = end + 1U;

      const std::string_view content = TrimRight(StripComment(raw));
      std::size_t indent = 0;
      while (indent < content.size() && content[indent] == ' ') {
        ++indent;
      }
      if (indent == content.size()) {
        continue;
      }
      if (content[indent] == '\t') {
        return Fail(number, "tab characters are not allowed in indentation", error);
      }

      const std::string_view text = content.substr(indent);
      if (indent == 0U && text.front() == '%') {
        return Fail(number, "directives are not supported", error);
      }
      if (indent == 0U && (text == "---" || text.substr(0, 4) == "--- ")) {
        if (saw_content || !lines_.empty()) {
          return Fail(number, "multiple documents are not supported", error);
        }
        saw_content = true;
        if (!TrimLeft(text.substr(3)).empty()) {
          return Fail(number, "content after document start marker is not supported", error);
        }
        continue;
      }
      if (indent == 0U && text == "...") {
        break;
      }

      saw_content = true;
      lines_.push_back({.number = number, .indent = indent, .text = std::string(text)});
    }
    return true;
  }

  // Parses the block starting at the current line, taking its indentation as
  // the block indentation.
  bool ParseBlock(Value& value, std::string& error) {
    const Line& first = lines_[pos_];
    if (IsSequenceEntry(first.text)) {
      return ParseSequence(first.indent, value, error);
    }

    std::string key;
    std::string rest;
    bool is_entry = false;
    if (!SplitMappingEntry(first, key, rest, is_entry, error)) {
      return false;
    }
    if (is_entry) {
      return ParseMapping(first.indent, value, error);
    }

    const std::size_t number = first.number;
    const std::string text = first.text;
    ++pos_;
    if (pos_ < lines_.size() && lines_[pos_].indent > first.indent) {
      return Fail(lines_[pos_].number, "unexpected indentation", error);
    }
    return ParseInline(text, number, value, error);
  }

  bool ParseSequence(std::size_t indent, Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kSequence;

    while (pos_ < lines_.size() && lines_[pos_].indent == indent &&
           IsSequenceEntry(lines_[pos_].text)) {
      Line& line = lines_[pos_];
      Value item;
      const std::string_view after_dash = std::string_view(line.text).substr(1);
      const std::string_view item_text = TrimLeft(after_dash);

      if (item_text.empty()) {
        ++pos_;
        if (pos_ < lines_.size() && lines_[pos_].indent > indent) {
          if (!ParseBlock(item, error)) {
            return false;
          }
        }
      } else {
        // Rewrite "- key: value" (or "- - nested") in place as a line indented
        // to the item text, then parse it as an ordinary nested block.
        line.indent = indent + 1U + (after_dash.size() - item_text.size());
        line.text = std::string(item_text);
        if (!ParseBlock(item, error)) {
          return false;
        }
      }
      value.sequence_value.push_back(std::move(item));
    }

    if (pos_ < lines_.size() && lines_[pos_].indent > indent) {
      return Fail(lines_[pos_].number, "unexpected indentation", error);
    }
    return true;
  }

  bool ParseMapping(std::size_t indent, Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kMapping;

    while (pos_ < lines_.size() && lines_[pos_].indent == indent) {
      const Line& line = lines_[pos_];
      if (IsSequenceEntry(line.text)) {
        return Fail(line.number, "sequence entry is not allowed inside a mapping", error);
      }

      std::string key;
      std::string rest;
      bool is_entry = false;
      if (!SplitMappingEntry(line, key, rest, is_entry, error)) {
        return false;
      }
      if (!is_entry) {
        return Fail(line.number, "expected 'key: value' mapping entry", error);
      }
      if (value.mapping_value.count(key) != 0U) {
        return Fail(line.number, "duplicate mapping key '" + key + "'", error);
      }

      const std::size_t number = line.number;
      ++pos_;
      Value child;
      if (!rest.empty()) {
        if (!ParseInline(rest, number, child, error)) {
          return false;
        }
      } else if (pos_ < lines_.size() && lines_[pos_].indent > indent) {
        if (!ParseBlock(child, error)) {
          return false;
        }
      } else if (pos_ < lines_.size() && lines_[pos_].indent == indent &&
                 IsSequenceEntry(lines_[pos_].text)) {
        if (!ParseSequence(indent, child, error)) {
          return false;
        }
      }
      value.mapping_value.emplace(std::move(key), std::move(child));
    }

    if (pos_ < lines_.size() && lines_[pos_].indent > indent) {
      return Fail(lines_[pos_].number, "unexpected indentation", error);
    }
    return true;
  }

  // Finds the `:` separating key and value. `is_entry` is false when the line
  // holds no mapping separator at all (a bare scalar).
  bool SplitMappingEntry(const Line& line, std::string& key, std::string& rest, bool& is_entry,
                         std::string& error) const {
    is_entry = false;
    const std::string_view text = line.text;

    std::size_t colon = std::string_view::npos;
    if (text.front() == '"' || text.front() == '\'') {
      const std::size_t close = FindClosingQuote(text);
      if (close == std::string_view::npos) {
        return Fail(line.number, "unterminated quoted string", error);
      }
      const std::string_view after = TrimLeft(text.substr(close + 1U));
      if (after.empty()) {
        return true;
      }
      if (after.front() != ':' || (after.size() > 1U && after[1] != ' ')) {
        return true;
      }
      if (!Unquote(text.substr(0, close + 1U), line.number, key, error)) {
        return false;
      }
      rest = std::string(TrimLeft(after.substr(1)));
      is_entry = true;
      return true;
    }

    for (std::size_t i = 0; i < text.size(); ++i) {
      if (text[i] == ':' && (i + 1U == text.size() || text[i + 1U] == ' ')) {
        colon = i;
        break;
      }
    }
    if (colon == std::string_view::npos) {
      return true;
    }

    key = std::string(TrimRight(text.substr(0, colon)));
    if (key.empty()) {
      return Fail(line.number, "mapping key must not be empty", error);
    }
    if (key.front() == '[' || key.front() == '{' || key.front() == '?') {
      return Fail(line.number, "complex mapping keys are not supported", error);
    }
    rest = std::string(TrimLeft(text.substr(colon + 1U)));
    is_entry = true;
    return true;
  }

  static std::size_t FindClosingQuote(std::string_view text) {
    const char quote = text.front();
    for (std::size_t i = 1; i < text.size(); ++i) {
      if (quote == '"' && text[i] == '\\') {
        ++i;
        continue;
      }
      if (text[i] == quote) {
        if (quote == '\'' && i + 1U < text.size() && text[i + 1U] == '\'') {
          ++i;
          continue;
        }
        return i;
      }
    }
    return std::string_view::npos;
  }

  bool Unquote(std::string_view quoted, std::size_t number, std::string& out,
               std::string& error) const {
    out.clear();
    const char quote = quoted.front();
    const std::string_view body = quoted.substr(1, quoted.size() - 2U);

    if (quote == '\'') {
      for (std::size_t i = 0; i < body.size(); ++i) {
        out.push_back(body[i]);
        if (body[i] == '\'') {
          ++i;
        }
      }
      return true;
    }

    for (std::size_t i = 0; i < body.size(); ++i) {
      const char c = body[i];
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (++i >= body.size()) {
        return Fail(number, "unterminated escape sequence in string", error);
      }
      switch (body[i]) {
      case '"':
      case '\\':
      case '/':
        out.push_back(body[i]);
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '0':
        out.push_back('\0');
        break;
      default:
        return Fail(number, "unsupported escape sequence in string", error);
      }
    }
    return true;
  }

  bool ParseScalar(std::string_view text, std::size_t number, Value& value,
                   std::string& error) const {
    value = Value{};
    if (text.empty()) {
      return true;
    }

    const char first = text.front();
    if (first == '"' || first == '\'') {
      const std::size_t close = FindClosingQuote(text);
      if (close == std::string_view::npos) {
        return Fail(number, "unterminated quoted string", error);
      }
      if (close + 1U != text.size()) {
        return Fail(number, "unexpected content after quoted string", error);
      }
      value.type = Value::Type::kScalar;
      return Unquote(text, number, value.scalar_value, error);
    }

    switch (first) {
    case '&':
    case '*':
      return Fail(number, "anchors and aliases are not supported", error);
    case '!':
      return Fail(number, "tags are not supported", error);
    case '|':
    case '>':
      return Fail(number, "block scalars are not supported", error);
    case '{':
      return Fail(number, "flow mappings are not supported", error);
    case '@':
    case '`':
      return Fail(number, "plain scalar cannot start with reserved character", error);
    default:
      break;
    }

    if (text.find(": ") != std::string_view::npos || text.back() == ':') {
      return Fail(number, "mapping values are not allowed here", error);
    }

    if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
      return true;
    }
    value.type = Value::Type::kScalar;
    value.scalar_value = std::string(text);
    return true;
  }

  bool ParseFlowSequence(std::string_view text, std::size_t number, Value& value,
                         std::string& error) const {
    value = Value{};
    value.type = Value::Type::kSequence;

    if (text.back() != ']') {
      return Fail(number, "unterminated flow sequence", error);
    }
    const std::string_view body = text.substr(1, text.size() - 2U);
    if (TrimLeft(body).empty()) {
      return true;
    }

    std::size_t item_start = 0;
    char quote = '\0';
    for (std::size_t i = 0; i <= body.size(); ++i) {
      if (i < body.size()) {
        const char c = body[i];
        if (quote != '\0') {
          if (c == '\\' && quote == '"') {
            ++i;
          } else if (c == quote) {
            quote = '\0';
          }
          continue;
        }
        if (c == '"' || c == '\'') {
          quote = c;
          continue;
        }
        if (c == '[' || c == ']') {
          return Fail(number, "nested flow sequences are not supported", error);
        }
        if (c != ',') {
          continue;
        }
      } else if (quote != '\0') {
        return Fail(number, "unterminated quoted string", error);
      }

      const std::string_view item = TrimRight(TrimLeft(body.substr(item_start, i - item_start)));
      item_start = i + 1U;
      if (item.empty()) {
        if (i == body.size()) {
          // trailing comma
          break;
        }
        return Fail(number, "empty entry in flow sequence", error);
      }
      Value element;
      if (!ParseScalar(item, number, element, error)) {
        return false;
      }
      value.sequence_value.push_back(std::move(element));
    }
    return true;
  }

  bool ParseInline(std::string_view text, std::size_t number, Value& value,
                   std::string& error) const {
    if (!text.empty() && text.front() == '[') {
      return ParseFlowSequence(text, number, value, error);
    }
    return ParseScalar(text, number, value, error);
  }

  static bool Fail(std::size_t line, std::string_view message, std::string& error) {
    error = "parse error at line " + std::to_string(line) + ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::vector<Line> lines_;
  std::size_t pos_ = 0;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace rawiface::core::yaml

#endif // RAWIFACE_CORE_YAML_DOM_HPP_
