#include "service/operations.hpp"

#include "core/time_utils.hpp"

#include <utility>

namespace mediaprep::service {

namespace {

using core::json::MakeNumber;
using core::json::MakeObject;
using core::json::MakeString;
using JsonValue = core::json::Value;

constexpr std::string_view kEmptyInputSchema = R"json({
  "type": "object",
  "additionalProperties": false,
  "properties": {}
})json";

constexpr std::string_view kCardOutputSchema = R"json({
  "type": "object",
  "required": ["name", "version", "functions", "active_backend"],
  "properties": {
    "name": {"type": "string"},
    "version": {"type": "string"},
    "description": {"type": "string"},
    "division": {"type": "string"},
    "subsystem": {"type": "string"},
    "tags": {"type": "array", "items": {"type": "string"}},
    "functions": {"type": "array", "items": {"type": "object"}},
    "active_backend": {"type": "object"}
  }
})json";

constexpr std::string_view kMetricsOutputSchema = R"json({
  "type": "object",
  "required": ["total_calls", "successes", "failures", "success_rate", "failures_by_kind",
               "latency", "operations"],
  "properties": {
    "total_calls": {"type": "integer"},
    "successes": {"type": "integer"},
    "failures": {"type": "integer"},
    "success_rate": {"type": "number", "minimum": 0, "maximum": 1},
    "failures_by_kind": {"type": "object"},
    "latency": {"type": "object"},
    "operations": {"type": "object"},
    "uptime_ms": {"type": "integer"}
  }
})json";

constexpr std::string_view kHealthOutputSchema = R"json({
  "type": "object",
  "required": ["status", "name", "version", "uptime_ms", "active_backend"],
  "properties": {
    "status": {"type": "string", "enum": ["ok"]},
    "name": {"type": "string"},
    "version": {"type": "string"},
    "uptime_ms": {"type": "integer"},
    "active_backend": {"type": "string"},
    "raw_decoder": {"type": "string"}
  }
})json";

bool RegisterOne(OperationRouter& router, OperationSpec spec, std::string_view output_schema,
                 std::string& error) {
  if (!detail::ParseOperationSchema(spec.name, kEmptyInputSchema, spec.input_schema, error) ||
      !detail::ParseOperationSchema(spec.name, output_schema, spec.output_schema, error)) {
    return false;
  }
  spec.idempotent = true;
  spec.examples = {{"No input", MakeObject()}};
  return router.Register(std::move(spec), error);
}

} // namespace

bool RegisterSystemOperations(OperationRouter& router, const OperationContext& context,
                              std::string& error) {
  OperationSpec capabilities;
  capabilities.name = "media.capabilities";
  capabilities.description = "Return the service capability card.";
  capabilities.tags = {"introspection"};
  capabilities.latency_target_ms = 5;
  capabilities.handler = [&context](const Request&, std::string_view, HandlerResult& result,
                                    OperationError& op_error) {
    if (!context.capability_card_json) {
      op_error = MakeOperationError(core::errors::ErrorKind::kProcessingError,
                                    "capability card is not built yet");
      return false;
    }
    result.output = context.capability_card_json();
    return true;
  };
  if (!RegisterOne(router, std::move(capabilities), kCardOutputSchema, error)) {
    return false;
  }

  OperationSpec metrics;
  metrics.name = "media.metrics";
  metrics.description = "Return call counts, failure categories and latency percentiles.";
  metrics.tags = {"introspection", "metrics"};
  metrics.latency_target_ms = 5;
  metrics.handler = [&context](const Request&, std::string_view, HandlerResult& result,
                               OperationError&) {
    result.output = MetricsSnapshotToJson(context.metrics.Summary());
    return true;
  };
  if (!RegisterOne(router, std::move(metrics), kMetricsOutputSchema, error)) {
    return false;
  }

  OperationSpec health;
  health.name = "health";
  health.description = "Liveness check with uptime and the active compute backend.";
  health.tags = {"introspection", "health"};
  health.latency_target_ms = 5;
  health.handler = [&context](const Request&, std::string_view, HandlerResult& result,
                              OperationError&) {
    const accel::BackendSelection selection = context.selector.Select();
    JsonValue out = MakeObject();
    out.Set("status", MakeString("ok"));
    out.Set("name", MakeString(std::string(kServiceName)));
    out.Set("version", MakeString(std::string(kServiceVersion)));
    out.Set("uptime_ms",
            MakeNumber(static_cast<double>(core::ElapsedMillis(
                context.started_at, std::chrono::steady_clock::now()))));
    out.Set("active_backend", MakeString(std::string(accel::ToString(selection.backend))));
    out.Set("raw_decoder", MakeString(std::string(context.decoder.Name())));
    result.output = std::move(out);
    return true;
  };
  return RegisterOne(router, std::move(health), kHealthOutputSchema, error);
}

} // namespace mediaprep::service
