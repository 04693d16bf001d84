#pragma once

#include <array>
#include <string_view>

namespace mediaprep::core::errors {

// Process exit status of the `mediaprep` binary. `call` maps a failed outcome
// to kFailure; the startup codes let a supervisor tell a broken operation
// table apart from a socket that could not be bound.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kTransportFailed = 20,
};

inline constexpr std::array<ExitCode, 5> kAllExitCodes = {
    ExitCode::kSuccess, ExitCode::kFailure, ExitCode::kUsage, ExitCode::kConfigInvalid,
    ExitCode::kTransportFailed};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

// One-line meaning printed in the CLI usage text.
constexpr std::string_view Describe(ExitCode code) {
  switch (code) {
  case ExitCode::kSuccess:
    return "success";
  case ExitCode::kFailure:
    return "request or command failed";
  case ExitCode::kUsage:
    return "bad arguments";
  case ExitCode::kConfigInvalid:
    return "service could not be initialized";
  case ExitCode::kTransportFailed:
    return "socket could not be bound";
  }
  return "unknown";
}

} // namespace mediaprep::core::errors
