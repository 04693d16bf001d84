#include "common/assertions.hpp"
#include "service/wire_codec.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>

using mediaprep::tests::common::AssertContains;
using mediaprep::tests::common::Fail;

namespace json = mediaprep::core::json;
namespace service = mediaprep::service;

namespace {

void ExpectRejected(std::string_view body, std::string_view field) {
  service::Request request;
  service::OperationError error;
  if (service::ParseRequest(body, request, error)) {
    Fail("expected request to be rejected: " + std::string(body));
  }
  if (error.kind != mediaprep::core::errors::ErrorKind::kValidationError) {
    Fail("expected ValidationError for: " + std::string(body));
  }
  if (json::GetString(error.details, "field") != field) {
    Fail("expected details.field=" + std::string(field) + " for: " + std::string(body));
  }
}

} // namespace

int main() {
  {
    service::Request request;
    service::OperationError error;
    if (!service::ParseRequest(
            R"({"op":"raw.preview","input":{"input_path":"/a.nef"},"context":{"trace_id":"t-1"}})",
            request, error)) {
      Fail("expected well-formed request to parse: " + error.message);
    }
    if (request.op != "raw.preview" || json::GetString(request.input, "input_path") != "/a.nef" ||
        request.context.at("trace_id") != "t-1") {
      Fail("parsed request fields do not match");
    }
  }

  {
    service::Request request;
    service::OperationError error;
    if (!service::ParseRequest(R"({"op":"health","input":null})", request, error)) {
      Fail("expected null input to be accepted");
    }
    if (!request.input.IsObject() || !request.input.object_value.empty()) {
      Fail("expected null input to become an empty object");
    }
  }

  ExpectRejected("not json", "$");
  ExpectRejected("[1,2]", "$");
  ExpectRejected(R"({"input":{}})", "$.op");
  ExpectRejected(R"({"op":5})", "$.op");
  ExpectRejected(R"({"op":"health","input":[1]})", "$.input");
  ExpectRejected(R"({"op":"health","context":{"trace_id":7}})", "$.context.trace_id");

  {
    service::Outcome outcome;
    outcome.ok = true;
    outcome.payload = json::MakeObject();
    outcome.payload.Set("width", json::MakeNumber(640));
    outcome.latency = std::chrono::nanoseconds(1'000'001);
    outcome.cost = 3.0;
    const std::string text = service::SerializeOutcome(outcome);
    if (text != R"({"cost":3,"latency_ms":2,"ok":true,"output":{"width":640}})") {
      Fail("unexpected outcome serialization: " + text);
    }
  }

  {
    service::Outcome outcome;
    outcome.latency = std::chrono::nanoseconds(1);
    const std::string text = service::SerializeOutcome(outcome);
    AssertContains(text, "\"cost\":null");
    AssertContains(text, "\"latency_ms\":1");
    AssertContains(text, "\"ok\":false");
  }

  {
    const auto header = service::EncodeFrameHeader(0x01020304U);
    if (header[0] != 0x01 || header[3] != 0x04) {
      Fail("expected big-endian frame header");
    }
    if (service::DecodeFrameHeader(header) != 0x01020304U) {
      Fail("frame header did not decode back");
    }
  }

  std::cout << "wire_codec_smoke: ok\n";
  return 0;
}
