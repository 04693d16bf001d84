#include "service/operation_router.hpp"

#include "service/schema_validator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace mediaprep::service {

namespace {

using core::errors::ErrorKind;
using JsonValue = core::json::Value;

bool IsObjectSchema(const JsonValue& schema) {
  if (!schema.IsObject()) {
    return false;
  }
  const JsonValue* type = schema.Find("type");
  return type == nullptr || (type->IsString() && type->string_value == "object");
}

OperationError BuildValidationError(const ValidationReport& report) {
  JsonValue issues = core::json::MakeArray();
  for (const ValidationIssue& issue : report.issues) {
    JsonValue entry = core::json::MakeObject();
    entry.Set("path", core::json::MakeString(issue.path));
    entry.Set("message", core::json::MakeString(issue.message));
    issues.Push(std::move(entry));
  }

  const ValidationIssue& first = report.issues.front();
  JsonValue details = core::json::MakeObject();
  details.Set("field", core::json::MakeString(first.path));
  details.Set("issues", std::move(issues));
  return MakeOperationError(ErrorKind::kValidationError, first.path + " " + first.message,
                            std::move(details));
}

Outcome FailedOutcome(const OperationError& error) {
  Outcome outcome;
  outcome.ok = false;
  outcome.payload = BuildErrorPayload(error);
  return outcome;
}

} // namespace

OperationRouter::OperationRouter(MetricsCollector& metrics, core::logging::Logger* logger)
    : metrics_(metrics), logger_(logger) {}

bool OperationRouter::Register(OperationSpec spec, std::string& error) {
  error.clear();
  if (frozen_) {
    error = "cannot register operation '" + spec.name + "': router is frozen";
    return false;
  }
  if (spec.name.empty()) {
    error = "operation name cannot be empty";
    return false;
  }
  if (index_.find(spec.name) != index_.end()) {
    error = "duplicate operation registration: '" + spec.name + "'";
    return false;
  }
  if (!spec.handler) {
    error = "operation '" + spec.name + "' has no handler";
    return false;
  }

  if (spec.input_schema.IsNull()) {
    spec.input_schema = core::json::MakeObject();
    spec.input_schema.Set("type", core::json::MakeString("object"));
  }
  if (!IsObjectSchema(spec.input_schema)) {
    error = "operation '" + spec.name + "' input schema must describe an object";
    return false;
  }
  if (!spec.output_schema.IsNull() && !spec.output_schema.IsObject()) {
    error = "operation '" + spec.name + "' output schema must be a JSON object";
    return false;
  }

  metrics_.RegisterOperation(spec.name);
  index_.emplace(spec.name, operations_.size());
  operations_.push_back(std::move(spec));
  return true;
}

void OperationRouter::Freeze() {
  frozen_ = true;
}

const OperationSpec* OperationRouter::Find(std::string_view name) const {
  const auto it = index_.find(name);
  return it == index_.end() ? nullptr : &operations_[it->second];
}

std::vector<std::string> OperationRouter::OperationNames() const {
  std::vector<std::string> names;
  names.reserve(index_.size());
  for (const auto& [name, position] : index_) {
    (void)position;
    names.push_back(name);
  }
  return names;
}

std::string OperationRouter::ResolveRequestId(const Request& request) {
  for (const char* key : {"trace_id", "request_id"}) {
    const auto it = request.context.find(key);
    if (it != request.context.end() && !it->second.empty()) {
      return it->second;
    }
  }
  return "req-" + std::to_string(next_request_id_.fetch_add(1U, std::memory_order_relaxed));
}

Outcome OperationRouter::Dispatch(const Request& request) {
  const auto started = std::chrono::steady_clock::now();
  const std::string request_id = ResolveRequestId(request);

  std::optional<ErrorKind> failure;
  Outcome outcome = Execute(request, request_id, failure);

  const auto elapsed = std::chrono::steady_clock::now() - started;
  outcome.latency = std::max(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed),
                             std::chrono::nanoseconds(1));

  metrics_.Record(request.op, outcome.ok, outcome.latency, failure);

  if (logger_ != nullptr) {
    const std::string latency_us = std::to_string(
        std::chrono::duration_cast<std::chrono::microseconds>(outcome.latency).count());
    if (outcome.ok) {
      logger_->Log(core::logging::LogLevel::kDebug, request_id, "request_completed",
                   {{"op", request.op}, {"latency_us", latency_us}});
    } else {
      logger_->Log(core::logging::LogLevel::kInfo, request_id, "request_failed",
                   {{"op", request.op},
                    {"error", core::errors::ToString(failure.value_or(ErrorKind::kProcessingError))},
                    {"latency_us", latency_us}});
    }
  }
  return outcome;
}

Outcome OperationRouter::Execute(const Request& request, std::string_view request_id,
                                 std::optional<ErrorKind>& failure) {
  const OperationSpec* spec = Find(request.op);
  if (spec == nullptr) {
    failure = ErrorKind::kUnsupportedOperation;
    JsonValue details = core::json::MakeObject();
    details.Set("op", core::json::MakeString(request.op));
    details.Set("available_operations", core::json::MakeStringArray(OperationNames()));
    return FailedOutcome(MakeOperationError(ErrorKind::kUnsupportedOperation,
                                            "unsupported operation '" + request.op + "'",
                                            std::move(details)));
  }

  ValidationReport report;
  ValidateInstance(spec->input_schema, request.input, report);
  if (!report.valid) {
    failure = ErrorKind::kValidationError;
    return FailedOutcome(BuildValidationError(report));
  }

  HandlerResult result;
  OperationError error;
  bool ok = false;
  try {
    ok = spec->handler(request, request_id, result, error);
  } catch (const std::exception& ex) {
    error = MakeOperationError(ErrorKind::kProcessingError,
                              std::string("handler raised an exception: ") + ex.what());
    ok = false;
  } catch (...) {
    error = MakeOperationError(ErrorKind::kProcessingError,
                              "handler raised a non-standard exception");
    ok = false;
  }

  if (!ok) {
    failure = error.kind;
    return FailedOutcome(error);
  }

  Outcome outcome;
  outcome.ok = true;
  outcome.payload = std::move(result.output);
  outcome.cost = result.cost;
  return outcome;
}

} // namespace mediaprep::service
