#pragma once

#include "raw/raw_decoder.hpp"

namespace mediaprep::raw {

// Decoder used when the binary was built without LibRaw. Every call reports
// kUnavailable with a message naming the build option, so the extraction
// tiers decline cleanly and callers get NoUsablePreview instead of a crash.
class UnavailableRawDecoder final : public IRawDecoder {
public:
  std::string_view Name() const override;

  DecodeStatus TryEmbeddedPreview(const std::filesystem::path& path, cv::Mat& image,
                                  std::string& message) override;
  DecodeStatus DecodeReduced(const std::filesystem::path& path, cv::Mat& image,
                             std::string& message) override;
  DecodeStatus DecodeFull(const std::filesystem::path& path, cv::Mat& image,
                          std::string& message) override;
  DecodeStatus ReadMetadata(const std::filesystem::path& path, RawMetadata& metadata,
                            std::string& message) override;
};

} // namespace mediaprep::raw
