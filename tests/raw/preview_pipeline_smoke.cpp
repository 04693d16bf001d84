#include "accel/backend_selector.hpp"
#include "common/assertions.hpp"
#include "common/fake_raw_decoder.hpp"
#include "imaging/codec.hpp"
#include "raw/preview_pipeline.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using mediaprep::core::errors::ErrorKind;
using mediaprep::raw::DecodeStatus;
using mediaprep::raw::ExtractionTier;
using mediaprep::tests::common::AssertContains;
using mediaprep::tests::common::Fail;
using mediaprep::tests::common::FakeRawDecoder;

namespace {

const std::filesystem::path kSource = "/photos/DSC_0042.NEF";

} // namespace

int main() {
  mediaprep::accel::BackendSelector selector(std::vector<mediaprep::accel::CapabilityProbe>{});

  // No embedded preview: reduced decode, then fit into max_dimension.
  {
    FakeRawDecoder decoder;
    decoder.embedded = {DecodeStatus::kAbsent, 0, 0, "no thumbnail"};
    decoder.reduced = {DecodeStatus::kOk, 3008, 2000, ""};
    mediaprep::raw::PreviewPipeline pipeline(decoder, selector);

    mediaprep::raw::PreviewOptions options;
    options.format = mediaprep::imaging::OutputFormat::kJpeg;
    options.quality = 85;
    options.max_dimension = 1024;
    mediaprep::raw::PreviewResult result;
    mediaprep::raw::PreviewError error;
    if (!pipeline.Run(kSource, options, "t", result, error)) {
      Fail("expected preview to succeed: " + error.message);
    }
    if (result.source_tier != ExtractionTier::kFastDecode || decoder.full_calls.load() != 0) {
      Fail("expected FastDecode as the source tier");
    }
    if (std::max(result.width, result.height) != 1024 || result.width != 1024) {
      Fail("expected the longer side to be fitted to max_dimension");
    }
    if (result.bytes.size() < 3U || result.bytes[0] != 0xFF || result.bytes[1] != 0xD8) {
      Fail("expected JPEG magic bytes in the preview");
    }
    if (result.quality != 85 || result.resize.executed != mediaprep::accel::Backend::kReference) {
      Fail("unexpected quality or resize backend");
    }

    cv::Mat decoded;
    std::string decode_error;
    if (!mediaprep::imaging::DecodeBytes(result.bytes, decoded, decode_error) ||
        decoded.cols != result.width || decoded.rows != result.height) {
      Fail("encoded preview does not decode back to the reported size");
    }
  }

  // Small previews are never enlarged.
  {
    FakeRawDecoder decoder;
    decoder.embedded = {DecodeStatus::kOk, 640, 480, ""};
    mediaprep::raw::PreviewPipeline pipeline(decoder, selector);
    mediaprep::raw::PreviewOptions options;
    options.format = mediaprep::imaging::OutputFormat::kPng;
    mediaprep::raw::PreviewResult result;
    mediaprep::raw::PreviewError error;
    if (!pipeline.Run(kSource, options, "t", result, error)) {
      Fail("expected embedded preview to succeed: " + error.message);
    }
    if (result.width != 640 || result.height != 480 ||
        result.source_tier != ExtractionTier::kEmbeddedPreview) {
      Fail("expected the embedded preview at its native size");
    }
  }

  // Every tier fails: NoUsablePreview with the attempt list.
  {
    FakeRawDecoder decoder;
    decoder.embedded = {DecodeStatus::kAbsent, 0, 0, "no thumbnail"};
    decoder.reduced = {DecodeStatus::kCorruptSource, 0, 0, "bad data"};
    decoder.full = {DecodeStatus::kCorruptSource, 0, 0, "bad data"};
    mediaprep::raw::PreviewPipeline pipeline(decoder, selector);
    mediaprep::raw::PreviewResult result;
    mediaprep::raw::PreviewError error;
    if (pipeline.Run(kSource, {}, "t", result, error)) {
      Fail("expected preview to fail");
    }
    if (error.kind != ErrorKind::kNoUsablePreview || error.attempts.size() != 3U) {
      Fail("expected NoUsablePreview with three attempts");
    }
    AssertContains(error.message, "DSC_0042.NEF");
  }

  std::cout << "preview_pipeline_smoke: ok\n";
  return 0;
}
