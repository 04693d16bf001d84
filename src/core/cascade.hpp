#ifndef MEDIAPREP_CORE_CASCADE_HPP_
#define MEDIAPREP_CORE_CASCADE_HPP_

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mediaprep::core {

// One entry in an ordered fallback chain. `attempt` returns a value when the
// candidate can serve the request, or std::nullopt with `reason` filled when it
// declines. Declining is never an error by itself; the caller decides what an
// exhausted cascade means.
template <typename Result>
struct CascadeCandidate {
  std::string name;
  std::function<std::optional<Result>(std::string& reason)> attempt;
};

struct CascadeRejection {
  std::string name;
  std::string reason;
};

template <typename Result>
struct CascadeOutcome {
  std::optional<Result> value;
  // Index into the candidate list of the winner; meaningless without `value`.
  std::size_t winner_index = 0;
  std::string winner_name;
  std::vector<CascadeRejection> rejections;

  bool succeeded() const {
    return value.has_value();
  }
};

// "First success wins" combinator shared by the backend probe and the RAW
// extraction tiers. Candidates run strictly in list order and nothing after
// the winner is attempted.
template <typename Result>
CascadeOutcome<Result> RunCascade(const std::vector<CascadeCandidate<Result>>& candidates) {
  CascadeOutcome<Result> outcome;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const CascadeCandidate<Result>& candidate = candidates[i];
    std::string reason;
    std::optional<Result> value;
    if (candidate.attempt) {
      value = candidate.attempt(reason);
    } else {
      reason = "candidate has no attempt function";
    }

    if (value.has_value()) {
      outcome.value = std::move(value);
      outcome.winner_index = i;
      outcome.winner_name = candidate.name;
      return outcome;
    }

    if (reason.empty()) {
      reason = "declined";
    }
    outcome.rejections.push_back(CascadeRejection{candidate.name, std::move(reason)});
  }
  return outcome;
}

} // namespace mediaprep::core

#endif // MEDIAPREP_CORE_CASCADE_HPP_
