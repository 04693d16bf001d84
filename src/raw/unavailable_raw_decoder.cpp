#include "raw/unavailable_raw_decoder.hpp"

#include <string>

namespace mediaprep::raw {

namespace {

std::string BuildUnavailableMessage() {
  return "RAW decoding is disabled at build time (set -DMEDIAPREP_ENABLE_LIBRAW=ON and install "
         "LibRaw to enable it)";
}

} // namespace

std::string_view UnavailableRawDecoder::Name() const {
  return "unavailable";
}

DecodeStatus UnavailableRawDecoder::TryEmbeddedPreview(const std::filesystem::path& /*path*/,
                                                       cv::Mat& /*image*/,
                                                       std::string& message) {
  message = BuildUnavailableMessage();
  return DecodeStatus::kUnavailable;
}

DecodeStatus UnavailableRawDecoder::DecodeReduced(const std::filesystem::path& /*path*/,
                                                  cv::Mat& /*image*/, std::string& message) {
  message = BuildUnavailableMessage();
  return DecodeStatus::kUnavailable;
}

DecodeStatus UnavailableRawDecoder::DecodeFull(const std::filesystem::path& /*path*/,
                                               cv::Mat& /*image*/, std::string& message) {
  message = BuildUnavailableMessage();
  return DecodeStatus::kUnavailable;
}

DecodeStatus UnavailableRawDecoder::ReadMetadata(const std::filesystem::path& /*path*/,
                                                 RawMetadata& /*metadata*/,
                                                 std::string& message) {
  message = BuildUnavailableMessage();
  return DecodeStatus::kUnavailable;
}

} // namespace mediaprep::raw
