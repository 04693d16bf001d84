#pragma once

#include "accel/backend_selector.hpp"
#include "accel/resizer.hpp"
#include "core/errors/error_kind.hpp"
#include "core/logging/logger.hpp"
#include "imaging/codec.hpp"
#include "raw/extraction_tiers.hpp"
#include "raw/raw_decoder.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprep::raw {

struct PreviewOptions {
  int quality = 92;
  int max_dimension = 2048;
  imaging::OutputFormat format = imaging::OutputFormat::kWebp;
  bool force_highest_tier = false;
};

struct PreviewResult {
  std::vector<unsigned char> bytes;
  int width = 0;
  int height = 0;
  imaging::OutputFormat format = imaging::OutputFormat::kWebp;
  int quality = 0;
  ExtractionTier source_tier = ExtractionTier::kEmbeddedPreview;
  std::vector<TierAttempt> attempts;
  accel::ResizeReport resize;
};

struct PreviewError {
  core::errors::ErrorKind kind = core::errors::ErrorKind::kProcessingError;
  std::string message;
  std::vector<TierAttempt> attempts;
};

// Extraction tiers -> resize on the active backend -> encode.
//
// Only an exhausted tier cascade produces kNoUsablePreview. Resize or encode
// problems after a tier succeeded are kProcessingError.
class PreviewPipeline {
public:
  PreviewPipeline(IRawDecoder& decoder, accel::BackendSelector& selector,
                  core::logging::Logger* logger = nullptr);

  bool Run(const std::filesystem::path& source, const PreviewOptions& options,
           std::string_view request_id, PreviewResult& result, PreviewError& error);

private:
  IRawDecoder& decoder_;
  accel::BackendSelector& selector_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace mediaprep::raw
