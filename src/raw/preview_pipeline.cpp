#include "raw/preview_pipeline.hpp"

#include <utility>

namespace mediaprep::raw {

PreviewPipeline::PreviewPipeline(IRawDecoder& decoder, accel::BackendSelector& selector,
                                 core::logging::Logger* logger)
    : decoder_(decoder), selector_(selector), logger_(logger) {}

bool PreviewPipeline::Run(const std::filesystem::path& source, const PreviewOptions& options,
                          std::string_view request_id, PreviewResult& result,
                          PreviewError& error) {
  result = PreviewResult{};
  error = PreviewError{};

  ExtractionResult extraction;
  if (!ExtractImage(decoder_, source, options.force_highest_tier, extraction, logger_,
                    request_id)) {
    error.kind = core::errors::ErrorKind::kNoUsablePreview;
    error.message = "no extraction tier produced a usable image for '" + source.string() +
                    "': " + DescribeAttempts(extraction.attempts);
    error.attempts = std::move(extraction.attempts);
    return false;
  }

  const accel::Dimensions target =
      accel::FitWithin(extraction.image.cols, extraction.image.rows, options.max_dimension);

  cv::Mat resized;
  std::string resize_error;
  if (!accel::Resize(extraction.image, target.width, target.height, selector_.ActiveBackend(),
                     resized, result.resize, resize_error)) {
    error.kind = core::errors::ErrorKind::kProcessingError;
    error.message = resize_error;
    error.attempts = std::move(extraction.attempts);
    return false;
  }

  if (result.resize.fell_back() && logger_ != nullptr) {
    logger_->Log(core::logging::LogLevel::kDebug, request_id, "resize_backend_fallback",
                 {{"requested", accel::ToString(result.resize.requested)},
                  {"executed", accel::ToString(result.resize.executed)},
                  {"reason", result.resize.fallback_reason}});
  }

  std::string encode_error;
  if (!imaging::Encode(resized, options.format, options.quality, result.bytes, encode_error)) {
    error.kind = core::errors::ErrorKind::kProcessingError;
    error.message = encode_error;
    error.attempts = std::move(extraction.attempts);
    return false;
  }

  result.width = resized.cols;
  result.height = resized.rows;
  result.format = options.format;
  result.quality = options.quality;
  result.source_tier = extraction.source_tier;
  result.attempts = std::move(extraction.attempts);
  return true;
}

} // namespace mediaprep::raw
