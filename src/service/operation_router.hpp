#pragma once

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "service/metrics_collector.hpp"
#include "service/request.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprep::service {

// Handler contract: return true and fill `result`, or return false and fill
// `error`. Exceptions are tolerated (the router converts them) but handlers
// should report expected failures through `error`.
using OperationHandler = std::function<bool(const Request& request, std::string_view request_id,
                                            HandlerResult& result, OperationError& error)>;

struct OperationExample {
  std::string description;
  core::json::Value input;
};

// Everything the router and the capability card need to know about one
// operation.
struct OperationSpec {
  std::string name;
  std::string description;
  std::vector<std::string> tags;
  std::vector<OperationExample> examples;
  core::json::Value input_schema;
  core::json::Value output_schema;
  std::vector<std::string> side_effects;
  bool idempotent = true;
  std::int64_t latency_target_ms = 0;
  OperationHandler handler;
};

// Name -> handler table with one dispatch path:
// Received -> Validated -> Executing -> Completed | Failed.
//
// The table is built at startup and frozen before serving; Dispatch() only
// reads it, so concurrent workers share one router without locking. Every
// Dispatch() call yields exactly one Outcome and one metrics record.
class OperationRouter {
public:
  explicit OperationRouter(MetricsCollector& metrics, core::logging::Logger* logger = nullptr);

  OperationRouter(const OperationRouter&) = delete;
  OperationRouter& operator=(const OperationRouter&) = delete;

  // Fails when the name is empty or already taken, when the handler is
  // missing, when a schema is not an object schema, or after Freeze().
  bool Register(OperationSpec spec, std::string& error);

  void Freeze();

  bool frozen() const {
    return frozen_;
  }

  Outcome Dispatch(const Request& request);

  const OperationSpec* Find(std::string_view name) const;

  // Registration order.
  const std::vector<OperationSpec>& operations() const {
    return operations_;
  }

  // Sorted by name.
  std::vector<std::string> OperationNames() const;

  // `context.trace_id` or `context.request_id` when present, otherwise a
  // process-unique `req-<n>` id.
  std::string ResolveRequestId(const Request& request);

private:
  Outcome Execute(const Request& request, std::string_view request_id,
                  std::optional<core::errors::ErrorKind>& failure);

  MetricsCollector& metrics_;
  core::logging::Logger* logger_ = nullptr;

  std::vector<OperationSpec> operations_;
  std::map<std::string, std::size_t, std::less<>> index_;
  bool frozen_ = false;
  std::atomic<std::uint64_t> next_request_id_{1};
};

} // namespace mediaprep::service
