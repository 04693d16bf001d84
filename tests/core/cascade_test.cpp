#include "core/cascade.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

namespace {

using mediaprep::core::CascadeCandidate;
using mediaprep::core::RunCascade;

CascadeCandidate<int> Declining(std::string name, std::string reason, int& calls) {
  return {std::move(name), [reason, &calls](std::string& why) -> std::optional<int> {
            ++calls;
            why = reason;
            return std::nullopt;
          }};
}

CascadeCandidate<int> Producing(std::string name, int value, int& calls) {
  return {std::move(name), [value, &calls](std::string&) -> std::optional<int> {
            ++calls;
            return value;
          }};
}

} // namespace

TEST_CASE("RunCascade returns the first producing candidate", "[core][cascade]") {
  int first = 0;
  int second = 0;
  int third = 0;
  const std::vector<CascadeCandidate<int>> candidates = {
      Declining("a", "not here", first),
      Producing("b", 7, second),
      Producing("c", 9, third),
  };

  const auto outcome = RunCascade(candidates);
  REQUIRE(outcome.succeeded());
  REQUIRE(*outcome.value == 7);
  REQUIRE(outcome.winner_index == 1U);
  REQUIRE(outcome.winner_name == "b");
  REQUIRE(outcome.rejections.size() == 1U);
  REQUIRE(outcome.rejections.front().name == "a");
  REQUIRE(outcome.rejections.front().reason == "not here");
  REQUIRE(first == 1);
  REQUIRE(second == 1);
  REQUIRE(third == 0);
}

TEST_CASE("RunCascade reports every rejection when exhausted", "[core][cascade]") {
  int calls = 0;
  const std::vector<CascadeCandidate<int>> candidates = {
      Declining("a", "no device", calls),
      Declining("b", "", calls),
      {"c", nullptr},
  };

  const auto outcome = RunCascade(candidates);
  REQUIRE_FALSE(outcome.succeeded());
  REQUIRE(calls == 2);
  REQUIRE(outcome.rejections.size() == 3U);
  REQUIRE(outcome.rejections[1].reason == "declined");
  REQUIRE(outcome.rejections[2].reason == "candidate has no attempt function");
}

TEST_CASE("RunCascade on an empty list fails without rejections", "[core][cascade]") {
  const auto outcome = RunCascade(std::vector<CascadeCandidate<int>>{});
  REQUIRE_FALSE(outcome.succeeded());
  REQUIRE(outcome.rejections.empty());
}
