#pragma once

#include "core/errors/error_kind.hpp"
#include "core/json_dom.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace mediaprep::service {

// One caller request. Immutable once handed to the router.
struct Request {
  std::string op;
  core::json::Value input = core::json::MakeObject();
  std::map<std::string, std::string> context;
};

// Exactly one outcome per request. `payload` is the handler result when `ok`
// and an `{error, message, ...details}` object otherwise.
struct Outcome {
  bool ok = false;
  core::json::Value payload = core::json::MakeObject();
  std::chrono::nanoseconds latency{0};
  std::optional<double> cost;
};

// Structured failure returned by handlers and produced by the router itself.
// `details` must be an object (or null); its keys are merged into the error
// payload next to `error` and `message`.
struct OperationError {
  core::errors::ErrorKind kind = core::errors::ErrorKind::kProcessingError;
  std::string message;
  core::json::Value details;
};

inline OperationError MakeOperationError(core::errors::ErrorKind kind, std::string message,
                                         core::json::Value details = core::json::Value{}) {
  return OperationError{kind, std::move(message), std::move(details)};
}

// `{error:<kind>, message:<text>, ...details}`.
inline core::json::Value BuildErrorPayload(const OperationError& error) {
  core::json::Value payload = core::json::MakeObject();
  if (error.details.IsObject()) {
    payload.object_value = error.details.object_value;
  }
  payload.Set("error", core::json::MakeString(std::string(core::errors::ToString(error.kind))));
  payload.Set("message", core::json::MakeString(error.message));
  return payload;
}

// Successful handler result. `cost` stays unset for operations that do not
// report one.
struct HandlerResult {
  core::json::Value output = core::json::MakeObject();
  std::optional<double> cost;
};

} // namespace mediaprep::service
