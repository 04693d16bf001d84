#include "raw/extraction_tiers.hpp"

#include "core/cascade.hpp"

#include <optional>
#include <utility>

namespace mediaprep::raw {

namespace {

TierOutcome ToTierOutcome(DecodeStatus status) {
  switch (status) {
  case DecodeStatus::kOk:
    return TierOutcome::kProduced;
  case DecodeStatus::kAbsent:
    return TierOutcome::kDeclined;
  case DecodeStatus::kCorruptSource:
    return TierOutcome::kCorruptSource;
  case DecodeStatus::kUnavailable:
  case DecodeStatus::kFailed:
    return TierOutcome::kFailed;
  }
  return TierOutcome::kFailed;
}

DecodeStatus CallDecoder(IRawDecoder& decoder, ExtractionTier tier,
                         const std::filesystem::path& path, cv::Mat& image,
                         std::string& message) {
  switch (tier) {
  case ExtractionTier::kEmbeddedPreview:
    return decoder.TryEmbeddedPreview(path, image, message);
  case ExtractionTier::kFastDecode:
    return decoder.DecodeReduced(path, image, message);
  case ExtractionTier::kFullDecode:
    return decoder.DecodeFull(path, image, message);
  }
  message = "unknown extraction tier";
  return DecodeStatus::kFailed;
}

} // namespace

std::string_view ToString(ExtractionTier tier) {
  for (const TierInfo& info : kTierTable) {
    if (info.tier == tier) {
      return info.name;
    }
  }
  return "Unknown";
}

double RelativeCost(ExtractionTier tier) {
  for (const TierInfo& info : kTierTable) {
    if (info.tier == tier) {
      return info.relative_cost;
    }
  }
  return 0.0;
}

std::string_view ToString(TierOutcome outcome) {
  switch (outcome) {
  case TierOutcome::kProduced:
    return "produced";
  case TierOutcome::kDeclined:
    return "declined";
  case TierOutcome::kCorruptSource:
    return "corrupt_source";
  case TierOutcome::kFailed:
    return "failed";
  }
  return "failed";
}

bool ExtractImage(IRawDecoder& decoder, const std::filesystem::path& path,
                  bool force_highest_tier, ExtractionResult& result,
                  core::logging::Logger* logger, std::string_view request_id) {
  result = ExtractionResult{};

  std::vector<core::CascadeCandidate<cv::Mat>> candidates;
  for (const TierInfo& info : kTierTable) {
    if (force_highest_tier && info.tier != ExtractionTier::kFullDecode) {
      continue;
    }

    const ExtractionTier tier = info.tier;
    candidates.push_back(core::CascadeCandidate<cv::Mat>{
        std::string(info.name),
        [&decoder, &path, &result, logger, request_id, tier](
            std::string& reason) -> std::optional<cv::Mat> {
          cv::Mat image;
          std::string message;
          const DecodeStatus status = CallDecoder(decoder, tier, path, image, message);

          TierAttempt attempt;
          attempt.tier = tier;
          attempt.outcome = ToTierOutcome(status);
          if (attempt.outcome == TierOutcome::kProduced && (image.cols <= 0 || image.rows <= 0)) {
            attempt.outcome = TierOutcome::kDeclined;
            message = "decoder returned an empty image";
          }
          attempt.reason = attempt.outcome == TierOutcome::kProduced ? "" : message;
          result.attempts.push_back(attempt);

          if (attempt.outcome == TierOutcome::kProduced) {
            return image;
          }

          reason = message;
          if (logger != nullptr) {
            const std::string_view tier_name = ToString(tier);
            if (attempt.outcome == TierOutcome::kCorruptSource) {
              logger->Log(core::logging::LogLevel::kWarn, request_id,
                          "extraction_tier_corrupt_source",
                          {{"tier", tier_name}, {"path", path.string()}, {"reason", message}});
            } else {
              logger->Log(core::logging::LogLevel::kDebug, request_id, "extraction_tier_declined",
                          {{"tier", tier_name},
                           {"outcome", ToString(attempt.outcome)},
                           {"reason", message}});
            }
          }
          return std::nullopt;
        }});
  }

  core::CascadeOutcome<cv::Mat> outcome = core::RunCascade(candidates);
  if (!outcome.succeeded()) {
    return false;
  }

  result.image = std::move(*outcome.value);
  result.source_tier = result.attempts.back().tier;
  return true;
}

std::string DescribeAttempts(const std::vector<TierAttempt>& attempts) {
  std::string out;
  for (const TierAttempt& attempt : attempts) {
    if (!out.empty()) {
      out += "; ";
    }
    out += std::string(ToString(attempt.tier)) + ": " + std::string(ToString(attempt.outcome));
    if (!attempt.reason.empty()) {
      out += " (" + attempt.reason + ")";
    }
  }
  return out;
}

} // namespace mediaprep::raw
