#pragma once

#include <chrono>
#include <cctype>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <unistd.h>

namespace rawiface::core::logging {

// Thresholds selectable with --log-level. The wrapper itself only emits debug
// and info records; warn and error exist so a caller can silence them.
enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

struct LogLevelName {
  std::string_view name;
  LogLevel level;
};

inline constexpr LogLevelName kLogLevelNames[] = {
    {"debug", LogLevel::kDebug},
    {"info", LogLevel::kInfo},
    {"warn", LogLevel::kWarn},
    {"warning", LogLevel::kWarn},
    {"error", LogLevel::kError},
};

// Case-insensitive lookup of a --log-level value.
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  constexpr std::string_view kExpected = "(expected debug|info|warn|error)";
  if (raw.empty()) {
    error = "missing value for --log-level " + std::string(kExpected);
    return false;
  }

  std::string normalized;
  normalized.reserve(raw.size());
  for (const char c : raw) {
    normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  for (const LogLevelName& entry : kLogLevelNames) {
    if (entry.name == normalized) {
      level = entry.level;
      return true;
    }
  }

  error = "invalid --log-level '" + std::string(raw) + "' " + std::string(kExpected);
  return false;
}

// Structured stderr logger. One record per line:
//   ts_utc=... level=DEBUG pid=1234 program="tcpdump" msg="..." key="value"
//
// The wrapper execs into the target program, so every record is flushed
// immediately; nothing may sit in a buffer when the process image goes away.
class Logger {
public:
  explicit Logger(LogLevel min_level, std::string program = "-", std::ostream& out = std::cerr)
      : min_level_(min_level), program_(std::move(program)), out_(&out) {}

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Write(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Write(LogLevel::kInfo, message, fields);
  }

private:
  void Write(LogLevel level, std::string_view message,
             std::initializer_list<LogFieldView> fields) {
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
      return;
    }

    (*out_) << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
            << " level=" << ToString(level) << " pid=" << ::getpid()
            << " program=" << Quote(program_) << " msg=" << Quote(message);
    for (const auto& field : fields) {
      (*out_) << ' ' << field.key << '=' << Quote(field.value);
    }
    (*out_) << '\n';
    out_->flush();
  }

  static std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts) {
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count() %
        1000;

    const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
    std::tm utc_time{};
    if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
      return "";
    }

    std::ostringstream out;
    out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << millis << 'Z';
    return out.str();
  }

  // Interface names and forwarded arguments are caller-controlled text, so
  // control characters are written as \xNN rather than raw.
  static std::string Quote(std::string_view raw) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string quoted = "\"";
    for (const char c : raw) {
      const auto byte = static_cast<unsigned char>(c);
      if (c == '\\' || c == '"') {
        quoted.push_back('\\');
        quoted.push_back(c);
      } else if (std::iscntrl(byte) != 0) {
        quoted += "\\x";
        quoted.push_back(kHex[byte >> 4U]);
        quoted.push_back(kHex[byte & 0x0FU]);
      } else {
        quoted.push_back(c);
      }
    }
    quoted.push_back('"');
    return quoted;
  }

  LogLevel min_level_;
  std::string program_;
  std::ostream* out_;
};

} // namespace rawiface::core::logging
