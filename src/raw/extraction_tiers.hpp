#pragma once

#include "core/logging/logger.hpp"
#include "raw/raw_decoder.hpp"

#include <opencv2/core.hpp>

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprep::raw {

// Strategies for turning a RAW file into pixels, cheapest first.
enum class ExtractionTier {
  kEmbeddedPreview = 0,
  kFastDecode = 1,
  kFullDecode = 2,
};

struct TierInfo {
  ExtractionTier tier;
  std::string_view name;
  // Relative cost, roughly the wall-time ratio of the three LibRaw paths.
  double relative_cost;
  // Higher is better output quality.
  int quality_rank;
};

// Ordered by ascending cost.
inline constexpr std::array<TierInfo, 3> kTierTable = {{
    {ExtractionTier::kEmbeddedPreview, "EmbeddedPreview", 1.0, 1},
    {ExtractionTier::kFastDecode, "FastDecode", 3.0, 2},
    {ExtractionTier::kFullDecode, "FullDecode", 30.0, 3},
}};

std::string_view ToString(ExtractionTier tier);

double RelativeCost(ExtractionTier tier);

enum class TierOutcome {
  kProduced = 0,
  kDeclined = 1,
  kCorruptSource = 2,
  kFailed = 3,
};

std::string_view ToString(TierOutcome outcome);

struct TierAttempt {
  ExtractionTier tier = ExtractionTier::kEmbeddedPreview;
  TierOutcome outcome = TierOutcome::kDeclined;
  std::string reason;
};

struct ExtractionResult {
  cv::Mat image;
  ExtractionTier source_tier = ExtractionTier::kEmbeddedPreview;
  std::vector<TierAttempt> attempts;
};

// Runs the tier cascade against `decoder`.
//
// - force_highest_tier=false: EmbeddedPreview, FastDecode, FullDecode in that
//   order; the first usable image wins and later tiers are not touched.
// - force_highest_tier=true: FullDecode only.
//
// A corrupt-source failure still falls through to the next tier but is logged
// at warn level instead of debug. Returns false when no tier produced an
// image; `result.attempts` then says what each tier reported.
bool ExtractImage(IRawDecoder& decoder, const std::filesystem::path& path,
                  bool force_highest_tier, ExtractionResult& result,
                  core::logging::Logger* logger, std::string_view request_id);

// "EmbeddedPreview: declined (no thumbnail); FastDecode: ..." for messages.
std::string DescribeAttempts(const std::vector<TierAttempt>& attempts);

} // namespace mediaprep::raw
