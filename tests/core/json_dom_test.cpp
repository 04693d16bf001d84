#include "core/json_dom.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>

namespace json = mediaprep::core::json;

TEST_CASE("Parse reads nested objects and arrays", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"op":"raw.preview","input":{"quality":80,"tags":["a","b"]},)"
                      R"("flag":true,"none":null})",
                      root, error));
  REQUIRE(root.IsObject());
  REQUIRE(json::GetString(root, "op") == "raw.preview");

  const json::Value* input = root.Find("input");
  REQUIRE(input != nullptr);
  REQUIRE(json::GetInt(*input, "quality", 0) == 80);
  const json::Value* tags = input->Find("tags");
  REQUIRE(tags != nullptr);
  REQUIRE(tags->IsArray());
  REQUIRE(tags->array_value.size() == 2U);
  REQUIRE(json::GetBool(root, "flag", false));
  REQUIRE(root.Find("none")->IsNull());
}

TEST_CASE("Typed getters fall back on missing or mistyped keys", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"ratio":1.5,"name":7})", root, error));
  REQUIRE(json::GetInt(root, "ratio", -1) == -1);
  REQUIRE(json::GetString(root, "name", "fallback") == "fallback");
  REQUIRE(json::GetBool(root, "missing", true));
}

TEST_CASE("Parse decodes unicode escapes including surrogate pairs", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"s":"caf\u00e9 \ud83d\udcf7"})", root, error));
  REQUIRE(json::GetString(root, "s") == "caf\xc3\xa9 \xf0\x9f\x93\xb7");
}

TEST_CASE("Parse reports malformed input with a location", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE_FALSE(json::Parse(R"({"op": )", root, error));
  REQUIRE_FALSE(error.empty());
  REQUIRE(error.find("line") != std::string::npos);

  REQUIRE_FALSE(json::Parse(R"({"a":1} trailing)", root, error));
}

TEST_CASE("Serialize is compact with sorted keys and integral numbers", "[core][json]") {
  json::Value root = json::MakeObject();
  root.Set("zeta", json::MakeNumber(3));
  root.Set("alpha", json::MakeString("quote\"d"));
  root.Set("ratio", json::MakeNumber(0.5));
  json::Value list = json::MakeArray();
  list.Push(json::MakeBool(false));
  list.Push(json::MakeNull());
  root.Set("list", std::move(list));

  REQUIRE(json::Serialize(root) ==
          R"({"alpha":"quote\"d","list":[false,null],"ratio":0.5,"zeta":3})");
}

TEST_CASE("Serialize escapes control characters and keeps UTF-8 bytes", "[core][json]") {
  const json::Value text = json::MakeString("a\tb\x01\\ caf\xc3\xa9");
  REQUIRE(json::Serialize(text) == "\"a\\tb\\u0001\\\\ caf\xc3\xa9\"");
}

TEST_CASE("Parse rejects documents nested past the depth limit", "[core][json]") {
  json::Value root;
  std::string error;
  const std::string shallow = std::string(8, '[') + std::string(8, ']');
  REQUIRE(json::Parse(shallow, root, error));

  const std::string deep = std::string(200, '[') + std::string(200, ']');
  REQUIRE_FALSE(json::Parse(deep, root, error));
  REQUIRE(error.find("nested too deeply") != std::string::npos);
}

TEST_CASE("Parse keeps the last value for a repeated key", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"quality":10,"quality":80})", root, error));
  REQUIRE(json::GetInt(root, "quality", 0) == 80);
}
