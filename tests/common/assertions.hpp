#ifndef MEDIAPREP_TESTS_COMMON_ASSERTIONS_HPP_
#define MEDIAPREP_TESTS_COMMON_ASSERTIONS_HPP_

#include "core/json_dom.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace mediaprep::tests::common {

// Smoke tests stop at the first broken expectation; CTest reports the abort.
[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << "FAILED: " << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    Fail("missing \"" + std::string(needle) + "\" in:\n" + std::string(text));
  }
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    Fail("unexpected \"" + std::string(needle) + "\" in:\n" + std::string(text));
  }
}

inline std::string ReadFileToString(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("cannot open " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

// Fixture documents are trusted; a parse failure is a bug in the test itself.
inline core::json::Value ParseJsonOrFail(std::string_view text) {
  core::json::Value value;
  std::string error;
  if (!core::json::Parse(text, value, error)) {
    Fail("fixture json failed to parse: " + error);
  }
  return value;
}

// `error` field of a failure payload; empty for successful outputs.
inline std::string ErrorKindOf(const core::json::Value& payload) {
  return core::json::GetString(payload, "error");
}

} // namespace mediaprep::tests::common

#endif // MEDIAPREP_TESTS_COMMON_ASSERTIONS_HPP_
