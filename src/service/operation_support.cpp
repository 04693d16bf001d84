#include "service/operations.hpp"

#include <limits>
#include <system_error>
#include <utility>

namespace mediaprep::service::detail {

bool ParseOperationSchema(std::string_view op_name, std::string_view text,
                          core::json::Value& schema, std::string& error) {
  std::string parse_error;
  if (!ParseSchemaText(text, schema, parse_error)) {
    error = "operation '" + std::string(op_name) + "': " + parse_error;
    return false;
  }
  return true;
}

void SetPropertyDefault(core::json::Value& schema, std::string_view property,
                        core::json::Value value) {
  auto properties = schema.object_value.find("properties");
  if (properties == schema.object_value.end()) {
    return;
  }
  auto entry = properties->second.object_value.find(std::string(property));
  if (entry == properties->second.object_value.end()) {
    return;
  }
  entry->second.Set("default", std::move(value));
}

bool RequireExistingFile(const std::filesystem::path& path, std::string_view field,
                         OperationError& error) {
  std::error_code ec;
  if (std::filesystem::is_regular_file(path, ec) && !ec) {
    return true;
  }
  core::json::Value details = core::json::MakeObject();
  details.Set("field", core::json::MakeString(std::string(field)));
  error = MakeOperationError(core::errors::ErrorKind::kProcessingError,
                             "input file not found: " + path.string(), std::move(details));
  return false;
}

bool ReadIntField(const core::json::Value& input, std::string_view key, std::int64_t fallback,
                  int& out, OperationError& error) {
  const std::int64_t value = core::json::GetInt(input, key, fallback);
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    const std::string field = "$." + std::string(key);
    core::json::Value details = core::json::MakeObject();
    details.Set("field", core::json::MakeString(field));
    error = MakeOperationError(core::errors::ErrorKind::kValidationError,
                               field + " is out of range: " + std::to_string(value),
                               std::move(details));
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

core::json::Value ExampleInput(std::string_view json_text) {
  core::json::Value value;
  std::string error;
  if (!core::json::Parse(json_text, value, error)) {
    return core::json::MakeObject();
  }
  return value;
}

} // namespace mediaprep::service::detail
