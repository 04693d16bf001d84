#include "common/assertions.hpp"
#include "core/json_dom.hpp"
#include "service/schema_validator.hpp"

#include <iostream>
#include <string>
#include <string_view>

using mediaprep::tests::common::Fail;
using mediaprep::tests::common::ParseJsonOrFail;

namespace json = mediaprep::core::json;

namespace {

constexpr std::string_view kPreviewLikeSchema = R"json({
  "type": "object",
  "required": ["input_path"],
  "additionalProperties": false,
  "properties": {
    "input_path": {"type": "string", "minLength": 1},
    "quality": {"type": "integer", "minimum": 1, "maximum": 100, "default": 92},
    "format": {"type": "string", "enum": ["jpg", "png", "webp"]},
    "ratio": {"type": "number"},
    "lens": {"type": ["string", "null"]},
    "sizes": {"type": "array", "minItems": 1, "items": {"type": "integer", "minimum": 1}}
  }
})json";

bool ContainsIssue(const mediaprep::service::ValidationReport& report, std::string_view path,
                   std::string_view message_substring) {
  for (const auto& issue : report.issues) {
    if (issue.path == path && issue.message.find(message_substring) != std::string::npos) {
      return true;
    }
  }
  return false;
}

mediaprep::service::ValidationReport Validate(const json::Value& schema, std::string_view input) {
  mediaprep::service::ValidationReport report;
  mediaprep::service::ValidateInstance(schema, ParseJsonOrFail(input), report);
  return report;
}

} // namespace

int main() {
  json::Value schema;
  std::string error;
  if (!mediaprep::service::ParseSchemaText(kPreviewLikeSchema, schema, error)) {
    Fail("expected schema text to parse: " + error);
  }

  {
    const auto report = Validate(
        schema,
        R"({"input_path": "/a.cr2", "quality": 80, "format": "png", "ratio": 0.5, )"
        R"("lens": null, "sizes": [1, 2]})");
    if (!report.valid || !report.issues.empty()) {
      Fail("expected fully valid input to produce zero issues");
    }
  }

  {
    const auto report = Validate(schema, R"({"quality": 92})");
    if (report.valid) {
      Fail("expected missing required field to be rejected");
    }
    if (!ContainsIssue(report, "$.input_path", "required")) {
      Fail("expected required-field issue at $.input_path");
    }
  }

  {
    const auto report = Validate(schema, R"({"input_path": "/a.cr2", "quality": 101})");
    if (report.valid || report.issues.front().path != "$.quality") {
      Fail("expected quality above maximum to be reported first at $.quality");
    }
  }

  {
    const auto report = Validate(schema, R"({"input_path": "/a.cr2", "quality": 1.5})");
    if (!ContainsIssue(report, "$.quality", "integer")) {
      Fail("expected fractional number to fail an integer type check");
    }
  }

  {
    const auto report = Validate(schema, R"({"input_path": "/a.cr2", "format": "tiff"})");
    if (!ContainsIssue(report, "$.format", "tiff")) {
      Fail("expected enum violation to name the rejected value");
    }
  }

  {
    const auto report = Validate(schema, R"({"input_path": "/a.cr2", "colour": "red"})");
    if (!ContainsIssue(report, "$.colour", "not allowed")) {
      Fail("expected unknown property to be rejected by additionalProperties=false");
    }
  }

  {
    const auto report = Validate(schema, R"({"input_path": ""})");
    if (!ContainsIssue(report, "$.input_path", "empty")) {
      Fail("expected empty string to fail minLength");
    }
  }

  {
    const auto report = Validate(schema, R"({"input_path": "/a.cr2", "sizes": [4, 0, "x"]})");
    if (!ContainsIssue(report, "$.sizes[1]", ">=") ||
        !ContainsIssue(report, "$.sizes[2]", "integer")) {
      Fail("expected item issues with indexed paths");
    }
    const auto empty = Validate(schema, R"({"input_path": "/a.cr2", "sizes": []})");
    if (!ContainsIssue(empty, "$.sizes", "item")) {
      Fail("expected empty array to fail minItems");
    }
  }

  {
    const auto report = Validate(schema, R"(["not", "an", "object"])");
    if (!ContainsIssue(report, "$", "object")) {
      Fail("expected non-object root to be rejected at $");
    }
  }

  {
    json::Value bad;
    if (mediaprep::service::ParseSchemaText(R"({"type": )", bad, error)) {
      Fail("expected malformed schema text to fail");
    }
    if (mediaprep::service::ParseSchemaText(R"(["type"])", bad, error)) {
      Fail("expected non-object schema root to fail");
    }
  }

  std::cout << "schema_validation_smoke: ok\n";
  return 0;
}
