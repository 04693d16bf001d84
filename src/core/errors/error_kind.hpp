#pragma once

#include <string_view>

namespace mediaprep::core::errors {

// Failure categories surfaced in error outcomes and counted by metrics.
//
// - kUnsupportedOperation / kValidationError: caller errors, the handler never
//   ran.
// - kNoUsablePreview: every extraction tier declined or failed.
// - kBackendInitializationFailure: probe-time only; the reference backend
//   absorbs it, so it is logged but never returned to a caller.
// - kExternalToolFailure: decoder or transcoder reported a failure.
// - kProcessingError: anything else a handler hit (I/O, codec, exception).
enum class ErrorKind {
  kUnsupportedOperation = 0,
  kValidationError = 1,
  kNoUsablePreview = 2,
  kBackendInitializationFailure = 3,
  kExternalToolFailure = 4,
  kProcessingError = 5,
};

inline constexpr int kErrorKindCount = 6;

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kUnsupportedOperation:
    return "UnsupportedOperation";
  case ErrorKind::kValidationError:
    return "ValidationError";
  case ErrorKind::kNoUsablePreview:
    return "NoUsablePreview";
  case ErrorKind::kBackendInitializationFailure:
    return "BackendInitializationFailure";
  case ErrorKind::kExternalToolFailure:
    return "ExternalToolFailure";
  case ErrorKind::kProcessingError:
    return "ProcessingError";
  }
  return "ProcessingError";
}

constexpr int ToIndex(ErrorKind kind) {
  return static_cast<int>(kind);
}

} // namespace mediaprep::core::errors
