#ifndef MEDIAPREP_CORE_JSON_DOM_HPP_
#define MEDIAPREP_CORE_JSON_DOM_HPP_

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mediaprep::core::json {

// Minimal DOM shared by the wire codec, the schema validator, operation
// handlers and the capability card. Requests are parsed into it and every
// outcome payload is built with it before serialization.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
  bool IsNumber() const {
    return type == Type::kNumber;
  }
  bool IsBool() const {
    return type == Type::kBool;
  }
  bool IsNull() const {
    return type == Type::kNull;
  }

  // Number with no fractional part that fits in int64.
  bool IsInteger() const {
    if (type != Type::kNumber || !std::isfinite(number_value)) {
      return false;
    }
    return std::floor(number_value) == number_value &&
           std::abs(number_value) <= 9007199254740992.0;
  }

  // Object lookup; nullptr when this is not an object or the key is absent.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }

  // Object insert/overwrite. Converts a null value into an empty object first.
  Value& Set(std::string key, Value item) {
    if (type == Type::kNull) {
      type = Type::kObject;
    }
    Value& slot = object_value[std::move(key)];
    slot = std::move(item);
    return slot;
  }

  // Array append. Converts a null value into an empty array first.
  void Push(Value item) {
    if (type == Type::kNull) {
      type = Type::kArray;
    }
    array_value.push_back(std::move(item));
  }
};

inline Value MakeObject() {
  Value v;
  v.type = Value::Type::kObject;
  return v;
}

inline Value MakeArray() {
  Value v;
  v.type = Value::Type::kArray;
  return v;
}

inline Value MakeString(std::string text) {
  Value v;
  v.type = Value::Type::kString;
  v.string_value = std::move(text);
  return v;
}

inline Value MakeNumber(double number) {
  Value v;
  v.type = Value::Type::kNumber;
  v.number_value = number;
  return v;
}

inline Value MakeBool(bool flag) {
  Value v;
  v.type = Value::Type::kBool;
  v.bool_value = flag;
  return v;
}

inline Value MakeNull() {
  return Value{};
}

inline Value MakeStringArray(const std::vector<std::string>& items) {
  Value v = MakeArray();
  for (const auto& item : items) {
    v.Push(MakeString(item));
  }
  return v;
}

// Typed getters used by handlers after schema validation. They return the
// fallback when the key is absent or has a different type.
inline std::string GetString(const Value& object, std::string_view key,
                             std::string_view fallback = "") {
  const Value* item = object.Find(key);
  if (item == nullptr || !item->IsString()) {
    return std::string(fallback);
  }
  return item->string_value;
}

inline std::int64_t GetInt(const Value& object, std::string_view key, std::int64_t fallback) {
  const Value* item = object.Find(key);
  if (item == nullptr || !item->IsInteger()) {
    return fallback;
  }
  return static_cast<std::int64_t>(item->number_value);
}

inline bool GetBool(const Value& object, std::string_view key, bool fallback) {
  const Value* item = object.Find(key);
  if (item == nullptr || !item->IsBool()) {
    return fallback;
  }
  return item->bool_value;
}

namespace detail {

// Nesting limit for documents arriving over the socket.
inline constexpr int kMaxParseDepth = 64;

// Recursive-descent reader over one complete document. Diagnostics name the
// line and column of the offending byte.
class Reader {
public:
  explicit Reader(std::string_view text) : text_(text) {}

  bool ReadDocument(Value& root, std::string& error) {
    SkipSpace();
    if (!ReadValue(root, 0, error)) {
      return false;
    }
    SkipSpace();
    return pos_ == text_.size() || Error("unexpected trailing content after JSON value", error);
  }

private:
  bool ReadValue(Value& out, int depth, std::string& error) {
    if (pos_ == text_.size()) {
      return Error("unexpected end of input while parsing value", error);
    }
    switch (text_[pos_]) {
    case '{':
      return ReadObject(out, depth + 1, error);
    case '[':
      return ReadArray(out, depth + 1, error);
    case '"':
      out = Value{};
      out.type = Value::Type::kString;
      return ReadString(out.string_value, error);
    case 't':
      return ReadLiteral("true", out, error);
    case 'f':
      return ReadLiteral("false", out, error);
    case 'n':
      return ReadLiteral("null", out, error);
    default:
      break;
    }
    if (text_[pos_] == '-' || IsDigit(text_[pos_])) {
      out = Value{};
      out.type = Value::Type::kNumber;
      return ReadNumber(out.number_value, error);
    }
    return Error("expected JSON value", error);
  }

  bool ReadLiteral(std::string_view word, Value& out, std::string& error) {
    if (text_.substr(pos_, word.size()) != word) {
      return Error("expected JSON value", error);
    }
    Step(word.size());
    out = Value{};
    if (word == "null") {
      return true;
    }
    out.type = Value::Type::kBool;
    out.bool_value = word == "true";
    return true;
  }

  bool ReadObject(Value& out, int depth, std::string& error) {
    if (depth > kMaxParseDepth) {
      return Error("document nested too deeply", error);
    }
    out = MakeObject();
    Step(1);
    SkipSpace();
    if (Accept('}')) {
      return true;
    }
    for (;;) {
      SkipSpace();
      std::string key;
      if (Peek() != '"') {
        return Error("expected string object key", error);
      }
      if (!ReadString(key, error)) {
        return false;
      }
      SkipSpace();
      if (!Accept(':')) {
        return Error("expected ':' after object key", error);
      }
      SkipSpace();
      Value item;
      if (!ReadValue(item, depth, error)) {
        return false;
      }
      out.object_value.insert_or_assign(std::move(key), std::move(item));
      SkipSpace();
      if (Accept('}')) {
        return true;
      }
      if (!Accept(',')) {
        return Error("expected ',' between object entries", error);
      }
    }
  }

  bool ReadArray(Value& out, int depth, std::string& error) {
    if (depth > kMaxParseDepth) {
      return Error("document nested too deeply", error);
    }
    out = MakeArray();
    Step(1);
    SkipSpace();
    if (Accept(']')) {
      return true;
    }
    for (;;) {
      SkipSpace();
      Value item;
      if (!ReadValue(item, depth, error)) {
        return false;
      }
      out.array_value.push_back(std::move(item));
      SkipSpace();
      if (Accept(']')) {
        return true;
      }
      if (!Accept(',')) {
        return Error("expected ',' between array items", error);
      }
    }
  }

  bool ReadString(std::string& out, std::string& error) {
    out.clear();
    Step(1);
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (c == '"') {
        Step(1);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Error("control character in string is not allowed", error);
      }
      Step(1);
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (pos_ == text_.size()) {
        break;
      }
      const char escape = text_[pos_];
      Step(1);
      switch (escape) {
      case '"':
      case '\\':
      case '/':
        out.push_back(escape);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u':
        if (!ReadCodePoint(out, error)) {
          return false;
        }
        break;
      default:
        return Error("invalid escape sequence in string", error);
      }
    }
    return Error("unterminated string literal", error);
  }

  // JSON number grammar is checked here; strtod only converts the token.
  bool ReadNumber(double& out, std::string& error) {
    const std::size_t start = pos_;
    Accept('-');
    if (!Accept('0') && SkipDigits() == 0U) {
      return Error("expected digits in number", error);
    }
    if (Accept('.') && SkipDigits() == 0U) {
      return Error("expected digits after decimal point", error);
    }
    if (Accept('e') || Accept('E')) {
      if (!Accept('+')) {
        Accept('-');
      }
      if (SkipDigits() == 0U) {
        return Error("expected exponent digits", error);
      }
    }
    const std::string token(text_.substr(start, pos_ - start));
    errno = 0;
    out = std::strtod(token.c_str(), nullptr);
    if (errno == ERANGE && std::isinf(out)) {
      return Error("numeric value out of range", error);
    }
    return true;
  }

  bool ReadHex4(std::uint32_t& unit, std::string& error) {
    if (text_.size() - pos_ < 4U) {
      return Error("unterminated unicode escape", error);
    }
    unit = 0;
    for (int i = 0; i < 4; ++i) {
      const char c = text_[pos_];
      int digit = -1;
      if (IsDigit(c)) {
        digit = c - '0';
      } else if (c >= 'a' && c <= 'f') {
        digit = c - 'a' + 10;
      } else if (c >= 'A' && c <= 'F') {
        digit = c - 'A' + 10;
      }
      if (digit < 0) {
        return Error("invalid hex digit in unicode escape", error);
      }
      unit = (unit << 4U) | static_cast<std::uint32_t>(digit);
      Step(1);
    }
    return true;
  }

  // `\uXXXX`, joining surrogate pairs, appended as UTF-8.
  bool ReadCodePoint(std::string& out, std::string& error) {
    std::uint32_t code = 0;
    if (!ReadHex4(code, error)) {
      return false;
    }
    if (code >= 0xDC00U && code <= 0xDFFFU) {
      return Error("unpaired low surrogate in unicode escape", error);
    }
    if (code >= 0xD800U && code <= 0xDBFFU) {
      if (text_.substr(pos_, 2) != "\\u") {
        return Error("unpaired high surrogate in unicode escape", error);
      }
      Step(2);
      std::uint32_t low = 0;
      if (!ReadHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Error("invalid low surrogate in unicode escape", error);
      }
      code = 0x10000U + ((code - 0xD800U) << 10U) + (low - 0xDC00U);
    }

    int trailing = 0;
    if (code < 0x80U) {
      out.push_back(static_cast<char>(code));
      return true;
    }
    if (code < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (code >> 6U)));
      trailing = 1;
    } else if (code < 0x10000U) {
      out.push_back(static_cast<char>(0xE0U | (code >> 12U)));
      trailing = 2;
    } else {
      out.push_back(static_cast<char>(0xF0U | (code >> 18U)));
      trailing = 3;
    }
    for (int shift = (trailing - 1) * 6; shift >= 0; shift -= 6) {
      out.push_back(static_cast<char>(0x80U | ((code >> static_cast<unsigned>(shift)) & 0x3FU)));
    }
    return true;
  }

  static bool IsDigit(char c) {
    return c >= '0' && c <= '9';
  }

  char Peek() const {
    return pos_ < text_.size() ? text_[pos_] : '\0';
  }

  bool Accept(char expected) {
    if (Peek() != expected || pos_ == text_.size()) {
      return false;
    }
    Step(1);
    return true;
  }

  std::size_t SkipDigits() {
    std::size_t count = 0;
    while (pos_ < text_.size() && IsDigit(text_[pos_])) {
      Step(1);
      ++count;
    }
    return count;
  }

  void SkipSpace() {
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
        return;
      }
      Step(1);
    }
  }

  void Step(std::size_t count) {
    for (; count > 0U && pos_ < text_.size(); --count, ++pos_) {
      if (text_[pos_] == '\n') {
        ++line_;
        column_ = 1;
      } else {
        ++column_;
      }
    }
  }

  bool Error(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(column_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view text_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t column_ = 1;
};

} // namespace detail

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  detail::Reader reader(input);
  return reader.ReadDocument(root, error);
}

namespace detail {

// Quoted JSON string. Bytes >= 0x80 pass through so UTF-8 survives.
inline void AppendQuoted(std::string& out, std::string_view text) {
  static constexpr char kHex[] = "0123456789abcdef";
  out.push_back('"');
  for (const char ch : text) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto byte = static_cast<unsigned char>(ch);
      if (byte < 0x20U) {
        out += "\\u00";
        out.push_back(kHex[byte >> 4U]);
        out.push_back(kHex[byte & 0x0FU]);
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  out.push_back('"');
}

inline void AppendNumber(std::string& out, double number) {
  if (!std::isfinite(number)) {
    out += "null";
    return;
  }
  if (std::floor(number) == number && std::abs(number) < 1e15) {
    out += std::to_string(static_cast<std::int64_t>(number));
    return;
  }
  std::ostringstream text;
  text << std::setprecision(std::numeric_limits<double>::max_digits10) << number;
  out += text.str();
}

inline void AppendValue(std::string& out, const Value& value) {
  switch (value.type) {
  case Value::Type::kObject: {
    out.push_back('{');
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendQuoted(out, key);
      out.push_back(':');
      AppendValue(out, item);
    }
    out.push_back('}');
    return;
  }
  case Value::Type::kArray: {
    out.push_back('[');
    for (std::size_t i = 0; i < value.array_value.size(); ++i) {
      if (i > 0U) {
        out.push_back(',');
      }
      AppendValue(out, value.array_value[i]);
    }
    out.push_back(']');
    return;
  }
  case Value::Type::kString:
    AppendQuoted(out, value.string_value);
    return;
  case Value::Type::kNumber:
    AppendNumber(out, value.number_value);
    return;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNull:
    out += "null";
    return;
  }
}

} // namespace detail

// Compact serialization. Object keys come out in std::map order, which keeps
// responses and the exported capability card byte-stable across runs.
inline std::string Serialize(const Value& value) {
  std::string out;
  detail::AppendValue(out, value);
  return out;
}

} // namespace mediaprep::core::json

#endif // MEDIAPREP_CORE_JSON_DOM_HPP_
