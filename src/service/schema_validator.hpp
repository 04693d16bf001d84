#pragma once

#include "core/json_dom.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mediaprep::service {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Validates `instance` against the JSON Schema subset used by operation
// declarations:
// - `type` (string or array of strings): string, integer, number, boolean,
//   array, object, null. `integer` means a number with no fractional part.
// - `enum`, `minimum`, `maximum`, `minLength`
// - objects: `required`, `properties`, `additionalProperties: false`
// - arrays: `items`, `minItems`
// Unknown keywords (`description`, `default`, ...) are ignored. Issues are
// reported in document order with JSON paths rooted at `$`.
void ValidateInstance(const core::json::Value& schema, const core::json::Value& instance,
                      ValidationReport& report);

// Parses schema text embedded in the operation table and checks that its root
// is an object schema. Fails on malformed text so registration can reject it.
bool ParseSchemaText(std::string_view text, core::json::Value& schema, std::string& error);

} // namespace mediaprep::service
