#pragma once

#include "core/time_utils.hpp"

#include <array>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace mediaprep::core::logging {

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

namespace detail {

struct LevelName {
  LogLevel level;
  std::string_view wire;
  std::string_view label;
};

inline constexpr std::array<LevelName, 4> kLevelNames = {{
    {LogLevel::kDebug, "debug", "DEBUG"},
    {LogLevel::kInfo, "info", "INFO"},
    {LogLevel::kWarn, "warn", "WARN"},
    {LogLevel::kError, "error", "ERROR"},
}};

inline bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const char a = lhs[i] >= 'A' && lhs[i] <= 'Z' ? static_cast<char>(lhs[i] - 'A' + 'a') : lhs[i];
    if (a != rhs[i]) {
      return false;
    }
  }
  return true;
}

// Values are always quoted so a reader can split lines on spaces safely.
inline void AppendQuotedField(std::string& line, std::string_view raw) {
  line.push_back('"');
  for (const char c : raw) {
    switch (c) {
    case '\\':
      line += "\\\\";
      break;
    case '"':
      line += "\\\"";
      break;
    case '\n':
      line += "\\n";
      break;
    case '\r':
      line += "\\r";
      break;
    case '\t':
      line += "\\t";
      break;
    default:
      line.push_back(c);
      break;
    }
  }
  line.push_back('"');
}

} // namespace detail

inline std::string_view ToString(LogLevel level) {
  for (const detail::LevelName& entry : detail::kLevelNames) {
    if (entry.level == level) {
      return entry.label;
    }
  }
  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

// Accepts the wire names case-insensitively, plus `warning`.
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (detail::EqualsIgnoreCase(raw, "warning")) {
    level = LogLevel::kWarn;
    return true;
  }
  for (const detail::LevelName& entry : detail::kLevelNames) {
    if (detail::EqualsIgnoreCase(raw, entry.wire)) {
      level = entry.level;
      return true;
    }
  }
  error = "invalid log level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() + ")";
  return false;
}

// key=value line logger shared by the accept thread and every worker. Lines
// are assembled outside the lock and written whole under it, so concurrent
// requests never interleave output.
//
//   ts_utc=... level=WARN request_id="r-12" msg="frame_too_large" length="70000000"
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  // `request_id` is "-" for process-level lines (startup, probing, accept loop).
  void Log(LogLevel level, std::string_view request_id, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::string line = "ts_utc=";
    line += core::FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    line += " request_id=";
    detail::AppendQuotedField(line, request_id.empty() ? std::string_view("-") : request_id);
    line += " msg=";
    detail::AppendQuotedField(line, message);
    for (const LogFieldView& field : fields) {
      line.push_back(' ');
      line += field.key;
      line.push_back('=');
      detail::AppendQuotedField(line, field.value);
    }
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(write_mu_);
    out_->write(line.data(), static_cast<std::streamsize>(line.size()));
    out_->flush();
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, "-", message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, "-", message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, "-", message, fields);
  }

private:
  const LogLevel min_level_;
  std::ostream* out_;
  std::mutex write_mu_;
};

} // namespace mediaprep::core::logging
