#include "common/assertions.hpp"
#include "core/json_dom.hpp"
#include "service/metrics_collector.hpp"
#include "service/operation_router.hpp"
#include "service/schema_validator.hpp"

#include <atomic>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

using mediaprep::tests::common::AssertContains;
using mediaprep::tests::common::Fail;
using mediaprep::tests::common::ParseJsonOrFail;

namespace json = mediaprep::core::json;
namespace service = mediaprep::service;
using mediaprep::core::errors::ErrorKind;

namespace {

std::string PayloadString(const service::Outcome& outcome, std::string_view key) {
  return json::GetString(outcome.payload, key);
}

service::Request MakeRequest(std::string op, std::string_view input) {
  service::Request request;
  request.op = std::move(op);
  request.input = ParseJsonOrFail(input);
  return request;
}

} // namespace

int main() {
  std::ostringstream log_sink;
  mediaprep::core::logging::Logger logger(mediaprep::core::logging::LogLevel::kDebug, log_sink);
  service::MetricsCollector metrics;
  service::OperationRouter router(metrics, &logger);

  std::atomic<int> side_effects{0};

  service::OperationSpec echo;
  echo.name = "test.echo";
  echo.description = "echo the message back";
  echo.input_schema = ParseJsonOrFail(R"({"type": "object", "required": ["message"],
      "additionalProperties": false,
      "properties": {"message": {"type": "string", "minLength": 1}}})");
  echo.handler = [&side_effects](const service::Request& request, std::string_view request_id,
                                 service::HandlerResult& result, service::OperationError&) {
    ++side_effects;
    result.output = json::MakeObject();
    result.output.Set("echo", json::MakeString(json::GetString(request.input, "message")));
    result.output.Set("request_id", json::MakeString(std::string(request_id)));
    result.cost = 2.5;
    return true;
  };

  service::OperationSpec failing;
  failing.name = "test.fail";
  failing.handler = [](const service::Request&, std::string_view, service::HandlerResult&,
                       service::OperationError& error) {
    error = service::MakeOperationError(ErrorKind::kExternalToolFailure, "tool exited 1");
    return false;
  };

  service::OperationSpec throwing;
  throwing.name = "test.throw";
  throwing.handler = [](const service::Request&, std::string_view, service::HandlerResult&,
                        service::OperationError&) -> bool {
    throw std::runtime_error("boom");
  };

  std::string error;
  if (!router.Register(echo, error) || !router.Register(failing, error) ||
      !router.Register(throwing, error)) {
    Fail("expected registration to succeed: " + error);
  }
  if (router.Register(echo, error)) {
    Fail("expected duplicate registration to fail");
  }
  AssertContains(error, "test.echo");

  service::OperationSpec unnamed;
  unnamed.handler = echo.handler;
  if (router.Register(unnamed, error)) {
    Fail("expected empty operation name to be rejected");
  }

  service::OperationSpec no_handler;
  no_handler.name = "test.nohandler";
  if (router.Register(no_handler, error)) {
    Fail("expected operation without handler to be rejected");
  }

  router.Freeze();
  service::OperationSpec late;
  late.name = "test.late";
  late.handler = echo.handler;
  if (router.Register(late, error)) {
    Fail("expected registration after Freeze() to fail");
  }

  if (router.Find("test.echo") == nullptr || router.Find("test.late") != nullptr) {
    Fail("unexpected router table contents");
  }
  if (router.operations().front().name != "test.echo") {
    Fail("expected operations() to keep registration order");
  }
  if (router.operations()[1].input_schema.IsNull() ||
      json::GetString(router.operations()[1].input_schema, "type") != "object") {
    Fail("expected a missing input schema to default to an object schema");
  }

  // Success path.
  {
    service::Request request = MakeRequest("test.echo", R"({"message": "hi"})");
    request.context["trace_id"] = "trace-42";
    const service::Outcome outcome = router.Dispatch(request);
    if (!outcome.ok || PayloadString(outcome, "echo") != "hi") {
      Fail("expected echo to succeed");
    }
    if (PayloadString(outcome, "request_id") != "trace-42") {
      Fail("expected trace_id to become the request id");
    }
    if (!outcome.cost.has_value() || *outcome.cost != 2.5) {
      Fail("expected handler cost to be forwarded");
    }
    if (outcome.latency.count() <= 0) {
      Fail("expected positive latency");
    }
  }

  // Validation failures never reach the handler.
  {
    const int before = side_effects.load();
    const service::Outcome missing = router.Dispatch(MakeRequest("test.echo", "{}"));
    const service::Outcome extra =
        router.Dispatch(MakeRequest("test.echo", R"({"message": "x", "other": 1})"));
    const service::Outcome wrong_type =
        router.Dispatch(MakeRequest("test.echo", R"({"message": 5})"));
    if (side_effects.load() != before) {
      Fail("handler ran for an invalid request");
    }
    for (const service::Outcome* outcome : {&missing, &extra, &wrong_type}) {
      if (outcome->ok || PayloadString(*outcome, "error") != "ValidationError") {
        Fail("expected ValidationError outcome");
      }
      if (outcome->latency.count() <= 0) {
        Fail("expected positive latency on rejected request");
      }
    }
    if (PayloadString(missing, "field") != "$.message") {
      Fail("expected details.field to name the missing field");
    }
    if (PayloadString(extra, "field") != "$.other") {
      Fail("expected details.field to name the unknown field");
    }
    const json::Value* issues = wrong_type.payload.Find("issues");
    if (issues == nullptr || !issues->IsArray() || issues->array_value.empty()) {
      Fail("expected details.issues to list violations");
    }
  }

  // Unsupported operation.
  {
    const service::Outcome outcome = router.Dispatch(MakeRequest("test.missing", "{}"));
    if (outcome.ok || PayloadString(outcome, "error") != "UnsupportedOperation") {
      Fail("expected UnsupportedOperation");
    }
    if (PayloadString(outcome, "op") != "test.missing") {
      Fail("expected payload.op to echo the requested name");
    }
    const json::Value* available = outcome.payload.Find("available_operations");
    if (available == nullptr || available->array_value.size() != 3U ||
        available->array_value.front().string_value != "test.echo") {
      Fail("expected sorted available_operations");
    }
    if (outcome.latency.count() <= 0) {
      Fail("expected positive latency for unsupported operation");
    }
  }

  // Handler-reported failure and exception conversion.
  {
    const service::Outcome failed = router.Dispatch(MakeRequest("test.fail", "{}"));
    if (failed.ok || PayloadString(failed, "error") != "ExternalToolFailure" ||
        PayloadString(failed, "message") != "tool exited 1") {
      Fail("expected handler error to be forwarded unchanged");
    }
    const service::Outcome thrown = router.Dispatch(MakeRequest("test.throw", "{}"));
    if (thrown.ok || PayloadString(thrown, "error") != "ProcessingError") {
      Fail("expected exception to become ProcessingError");
    }
    AssertContains(PayloadString(thrown, "message"), "boom");
  }

  // Every outcome was recorded.
  const service::MetricsSnapshot snapshot = metrics.Summary();
  if (snapshot.total_calls != 7U || snapshot.successes != 1U || snapshot.failures != 6U) {
    Fail("unexpected metrics totals: calls=" + std::to_string(snapshot.total_calls));
  }
  const auto kind_count = [&snapshot](ErrorKind kind) {
    return snapshot.failures_by_kind[static_cast<std::size_t>(mediaprep::core::errors::ToIndex(kind))];
  };
  if (kind_count(ErrorKind::kValidationError) != 3U ||
      kind_count(ErrorKind::kUnsupportedOperation) != 1U ||
      kind_count(ErrorKind::kExternalToolFailure) != 1U ||
      kind_count(ErrorKind::kProcessingError) != 1U) {
    Fail("unexpected failure categories");
  }
  bool saw_unregistered = false;
  for (const auto& op : snapshot.operations) {
    if (op.name == service::kUnregisteredOperation) {
      saw_unregistered = op.calls == 1U;
    }
  }
  if (!saw_unregistered) {
    Fail("expected the unsupported call under 'unregistered'");
  }

  AssertContains(log_sink.str(), "request_failed");
  AssertContains(log_sink.str(), "trace-42");
  std::cout << "operation_router_smoke: ok\n";
  return 0;
}
