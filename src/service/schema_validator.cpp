#include "service/schema_validator.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace mediaprep::service {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string_view TypeName(const JsonValue& value) {
  switch (value.type) {
  case JsonValue::Type::kObject:
    return "object";
  case JsonValue::Type::kArray:
    return "array";
  case JsonValue::Type::kString:
    return "string";
  case JsonValue::Type::kNumber:
    return value.IsInteger() ? "integer" : "number";
  case JsonValue::Type::kBool:
    return "boolean";
  case JsonValue::Type::kNull:
    return "null";
  }
  return "null";
}

bool MatchesType(const JsonValue& value, std::string_view type_name) {
  if (type_name == "string") {
    return value.IsString();
  }
  if (type_name == "integer") {
    return value.IsInteger();
  }
  if (type_name == "number") {
    return value.IsNumber();
  }
  if (type_name == "boolean") {
    return value.IsBool();
  }
  if (type_name == "array") {
    return value.IsArray();
  }
  if (type_name == "object") {
    return value.IsObject();
  }
  if (type_name == "null") {
    return value.IsNull();
  }
  return false;
}

std::string FormatNumber(double number) {
  if (std::floor(number) == number && std::abs(number) < 1e15) {
    return std::to_string(static_cast<long long>(number));
  }
  std::ostringstream out;
  out << number;
  return out.str();
}

std::string ChildPath(const std::string& parent, std::string_view key) {
  return parent + "." + std::string(key);
}

std::string IndexPath(const std::string& parent, std::size_t index) {
  return parent + "[" + std::to_string(index) + "]";
}

bool CheckType(const JsonValue& schema, const JsonValue& instance, const std::string& path,
               ValidationReport& report) {
  const JsonValue* type = schema.Find("type");
  if (type == nullptr) {
    return true;
  }

  if (type->IsString()) {
    if (MatchesType(instance, type->string_value)) {
      return true;
    }
    AddIssue(report, path,
             "must be of type " + type->string_value + ", got " + std::string(TypeName(instance)));
    return false;
  }

  if (type->IsArray()) {
    std::string expected;
    for (const JsonValue& option : type->array_value) {
      if (!option.IsString()) {
        continue;
      }
      if (MatchesType(instance, option.string_value)) {
        return true;
      }
      if (!expected.empty()) {
        expected += "|";
      }
      expected += option.string_value;
    }
    AddIssue(report, path,
             "must be of type " + expected + ", got " + std::string(TypeName(instance)));
    return false;
  }
  return true;
}

void CheckEnum(const JsonValue& schema, const JsonValue& instance, const std::string& path,
               ValidationReport& report) {
  const JsonValue* allowed = schema.Find("enum");
  if (allowed == nullptr || !allowed->IsArray()) {
    return;
  }

  const std::string rendered = core::json::Serialize(instance);
  std::string choices;
  for (const JsonValue& option : allowed->array_value) {
    const std::string option_text = core::json::Serialize(option);
    if (option_text == rendered) {
      return;
    }
    if (!choices.empty()) {
      choices += ", ";
    }
    choices += option_text;
  }
  AddIssue(report, path, "must be one of [" + choices + "], got " + rendered);
}

void CheckNumberBounds(const JsonValue& schema, const JsonValue& instance,
                       const std::string& path, ValidationReport& report) {
  if (!instance.IsNumber()) {
    return;
  }
  const JsonValue* minimum = schema.Find("minimum");
  if (minimum != nullptr && minimum->IsNumber() &&
      instance.number_value < minimum->number_value) {
    AddIssue(report, path,
             "must be >= " + FormatNumber(minimum->number_value) + ", got " +
                 FormatNumber(instance.number_value));
  }
  const JsonValue* maximum = schema.Find("maximum");
  if (maximum != nullptr && maximum->IsNumber() &&
      instance.number_value > maximum->number_value) {
    AddIssue(report, path,
             "must be <= " + FormatNumber(maximum->number_value) + ", got " +
                 FormatNumber(instance.number_value));
  }
}

void CheckStringLength(const JsonValue& schema, const JsonValue& instance,
                       const std::string& path, ValidationReport& report) {
  if (!instance.IsString()) {
    return;
  }
  const JsonValue* min_length = schema.Find("minLength");
  if (min_length != nullptr && min_length->IsInteger() &&
      static_cast<double>(instance.string_value.size()) < min_length->number_value) {
    if (min_length->number_value == 1.0) {
      AddIssue(report, path, "must not be empty");
    } else {
      AddIssue(report, path,
               "must be at least " + FormatNumber(min_length->number_value) +
                   " characters long");
    }
  }
}

void ValidateNode(const JsonValue& schema, const JsonValue& instance, const std::string& path,
                  ValidationReport& report);

void CheckObject(const JsonValue& schema, const JsonValue& instance, const std::string& path,
                 ValidationReport& report) {
  if (!instance.IsObject()) {
    return;
  }

  if (const JsonValue* required = schema.Find("required");
      required != nullptr && required->IsArray()) {
    for (const JsonValue& key : required->array_value) {
      if (key.IsString() && instance.Find(key.string_value) == nullptr) {
        AddIssue(report, ChildPath(path, key.string_value), "is required");
      }
    }
  }

  const JsonValue* properties = schema.Find("properties");
  const JsonValue* additional = schema.Find("additionalProperties");
  const bool reject_unknown = additional != nullptr && additional->IsBool() &&
                              !additional->bool_value;

  for (const auto& [key, value] : instance.object_value) {
    const JsonValue* property_schema =
        properties != nullptr ? properties->Find(key) : nullptr;
    if (property_schema != nullptr) {
      ValidateNode(*property_schema, value, ChildPath(path, key), report);
      continue;
    }
    if (reject_unknown) {
      AddIssue(report, ChildPath(path, key), "is not an allowed property");
    }
  }
}

void CheckArray(const JsonValue& schema, const JsonValue& instance, const std::string& path,
                ValidationReport& report) {
  if (!instance.IsArray()) {
    return;
  }

  const JsonValue* min_items = schema.Find("minItems");
  if (min_items != nullptr && min_items->IsInteger() &&
      static_cast<double>(instance.array_value.size()) < min_items->number_value) {
    AddIssue(report, path,
             "must contain at least " + FormatNumber(min_items->number_value) + " item(s)");
  }

  const JsonValue* items = schema.Find("items");
  if (items == nullptr || !items->IsObject()) {
    return;
  }
  for (std::size_t i = 0; i < instance.array_value.size(); ++i) {
    ValidateNode(*items, instance.array_value[i], IndexPath(path, i), report);
  }
}

void ValidateNode(const JsonValue& schema, const JsonValue& instance, const std::string& path,
                  ValidationReport& report) {
  if (!schema.IsObject()) {
    return;
  }
  if (!CheckType(schema, instance, path, report)) {
    return;
  }
  CheckEnum(schema, instance, path, report);
  CheckNumberBounds(schema, instance, path, report);
  CheckStringLength(schema, instance, path, report);
  CheckObject(schema, instance, path, report);
  CheckArray(schema, instance, path, report);
}

} // namespace

void ValidateInstance(const JsonValue& schema, const JsonValue& instance,
                      ValidationReport& report) {
  report = ValidationReport{};
  ValidateNode(schema, instance, "$", report);
  report.valid = report.issues.empty();
}

bool ParseSchemaText(std::string_view text, JsonValue& schema, std::string& error) {
  std::string parse_error;
  if (!core::json::Parse(text, schema, parse_error)) {
    error = "schema is not valid JSON: " + parse_error;
    return false;
  }
  if (!schema.IsObject()) {
    error = "schema root must be an object";
    return false;
  }
  const JsonValue* type = schema.Find("type");
  if (type != nullptr && !(type->IsString() && type->string_value == "object")) {
    error = "schema root must declare type \"object\"";
    return false;
  }
  return true;
}

} // namespace mediaprep::service
