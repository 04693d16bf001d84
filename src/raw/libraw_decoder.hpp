#pragma once

#include "raw/raw_decoder.hpp"

#include <string>

namespace mediaprep::raw {

// LibRaw-backed decoder. Each call opens its own LibRaw processor, so one
// instance can be shared by every worker thread.
class LibRawDecoder final : public IRawDecoder {
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

private:
  DecodeStatus Demosaic(const std::filesystem::path& path, bool half_size, cv::Mat& image,
                        std::string& message);
};

std::string LibRawVersionText();

} // namespace mediaprep::raw
