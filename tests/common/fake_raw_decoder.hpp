#ifndef MEDIAPREP_TESTS_COMMON_FAKE_RAW_DECODER_HPP_
#define MEDIAPREP_TESTS_COMMON_FAKE_RAW_DECODER_HPP_

#include "raw/raw_decoder.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <string>
#include <string_view>

namespace mediaprep::tests::common {

// Scriptable decoder: each tier returns its configured status and, on kOk, a
// solid image of the configured size. Call counters let tests check which
// tiers actually ran.
struct FakeTierScript {
  raw::DecodeStatus status = raw::DecodeStatus::kAbsent;
  int width = 0;
  int height = 0;
  std::string message;
};

class FakeRawDecoder final : public raw::IRawDecoder {
public:
  FakeTierScript embedded;
  FakeTierScript reduced;
  FakeTierScript full;
  raw::DecodeStatus metadata_status = raw::DecodeStatus::kOk;
  raw::RawMetadata metadata;

  std::atomic<int> embedded_calls{0};
  std::atomic<int> reduced_calls{0};
  std::atomic<int> full_calls{0};
  std::atomic<int> metadata_calls{0};

  std::string_view Name() const override {
    return "fake";
  }

  raw::DecodeStatus TryEmbeddedPreview(const std::filesystem::path&, cv::Mat& image,
                                       std::string& message) override {
    ++embedded_calls;
    return Play(embedded, image, message);
  }

  raw::DecodeStatus DecodeReduced(const std::filesystem::path&, cv::Mat& image,
                                  std::string& message) override {
    ++reduced_calls;
    return Play(reduced, image, message);
  }

  raw::DecodeStatus DecodeFull(const std::filesystem::path&, cv::Mat& image,
                               std::string& message) override {
    ++full_calls;
    return Play(full, image, message);
  }

  raw::DecodeStatus ReadMetadata(const std::filesystem::path&, raw::RawMetadata& out,
                                 std::string& message) override {
    ++metadata_calls;
    if (metadata_status != raw::DecodeStatus::kOk) {
      message = "metadata rejected by fake decoder";
      return metadata_status;
    }
    out = metadata;
    return raw::DecodeStatus::kOk;
  }

private:
  static raw::DecodeStatus Play(const FakeTierScript& script, cv::Mat& image,
                                std::string& message) {
    message = script.message;
    if (script.status == raw::DecodeStatus::kOk) {
      image = cv::Mat(script.height, script.width, CV_8UC3, cv::Scalar(40, 90, 160));
    }
    return script.status;
  }
};

} // namespace mediaprep::tests::common

#endif // MEDIAPREP_TESTS_COMMON_FAKE_RAW_DECODER_HPP_
