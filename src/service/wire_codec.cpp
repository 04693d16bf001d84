#include "service/wire_codec.hpp"

#include <utility>

namespace mediaprep::service {

namespace {

using core::errors::ErrorKind;
using JsonValue = core::json::Value;

OperationError FieldError(std::string field, std::string message) {
  JsonValue details = core::json::MakeObject();
  details.Set("field", core::json::MakeString(std::move(field)));
  return MakeOperationError(ErrorKind::kValidationError, std::move(message), std::move(details));
}

} // namespace

bool ParseRequest(std::string_view body, Request& request, OperationError& error) {
  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(body, root, parse_error)) {
    error = FieldError("$", "request is not valid JSON: " + parse_error);
    return false;
  }
  if (!root.IsObject()) {
    error = FieldError("$", "request must be a JSON object");
    return false;
  }

  request = Request{};

  const JsonValue* op = root.Find("op");
  if (op == nullptr) {
    error = FieldError("$.op", "request is missing required field 'op'");
    return false;
  }
  if (!op->IsString()) {
    error = FieldError("$.op", "'op' must be a string");
    return false;
  }
  request.op = op->string_value;

  if (const JsonValue* input = root.Find("input"); input != nullptr && !input->IsNull()) {
    if (!input->IsObject()) {
      error = FieldError("$.input", "'input' must be an object");
      return false;
    }
    request.input = *input;
  }

  if (const JsonValue* context = root.Find("context");
      context != nullptr && !context->IsNull()) {
    if (!context->IsObject()) {
      error = FieldError("$.context", "'context' must be an object of strings");
      return false;
    }
    for (const auto& [key, value] : context->object_value) {
      if (!value.IsString()) {
        error = FieldError("$.context." + key, "context values must be strings");
        return false;
      }
      request.context.emplace(key, value.string_value);
    }
  }

  return true;
}

std::int64_t LatencyMillisRoundedUp(std::chrono::nanoseconds latency) {
  const std::int64_t nanos = latency.count();
  if (nanos <= 0) {
    return 0;
  }
  return (nanos + 999'999) / 1'000'000;
}

JsonValue OutcomeToJson(const Outcome& outcome) {
  JsonValue out = core::json::MakeObject();
  out.Set("ok", core::json::MakeBool(outcome.ok));
  out.Set("output", outcome.payload);
  out.Set("latency_ms",
          core::json::MakeNumber(static_cast<double>(LatencyMillisRoundedUp(outcome.latency))));
  out.Set("cost", outcome.cost.has_value() ? core::json::MakeNumber(*outcome.cost)
                                           : core::json::MakeNull());
  return out;
}

std::string SerializeOutcome(const Outcome& outcome) {
  return core::json::Serialize(OutcomeToJson(outcome));
}

std::array<unsigned char, kFrameHeaderBytes> EncodeFrameHeader(std::uint32_t body_length) {
  return {
      static_cast<unsigned char>((body_length >> 24U) & 0xFFU),
      static_cast<unsigned char>((body_length >> 16U) & 0xFFU),
      static_cast<unsigned char>((body_length >> 8U) & 0xFFU),
      static_cast<unsigned char>(body_length & 0xFFU),
  };
}

std::uint32_t DecodeFrameHeader(const std::array<unsigned char, kFrameHeaderBytes>& header) {
  return (static_cast<std::uint32_t>(header[0]) << 24U) |
         (static_cast<std::uint32_t>(header[1]) << 16U) |
         (static_cast<std::uint32_t>(header[2]) << 8U) | static_cast<std::uint32_t>(header[3]);
}

} // namespace mediaprep::service
