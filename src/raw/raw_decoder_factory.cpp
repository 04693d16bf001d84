#include "raw/raw_decoder.hpp"

#include "raw/unavailable_raw_decoder.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

#ifndef MEDIAPREP_ENABLE_LIBRAW
#define MEDIAPREP_ENABLE_LIBRAW 0
#endif

#if MEDIAPREP_ENABLE_LIBRAW
#include "raw/libraw_decoder.hpp"
#endif

namespace mediaprep::raw {

namespace {

constexpr std::array<std::string_view, 26> kRawExtensions = {
    ".3fr", ".arw", ".cr2", ".cr3", ".crw", ".dcr", ".dng", ".erf", ".fff",
    ".iiq", ".kdc", ".mef", ".mos", ".mrw", ".nef", ".nrw", ".orf", ".pef",
    ".raf", ".raw", ".rw2", ".rwl", ".sr2", ".srf", ".srw", ".x3f",
};

} // namespace

std::string_view ToString(DecodeStatus status) {
  switch (status) {
  case DecodeStatus::kOk:
    return "ok";
  case DecodeStatus::kAbsent:
    return "absent";
  case DecodeStatus::kUnavailable:
    return "unavailable";
  case DecodeStatus::kCorruptSource:
    return "corrupt_source";
  case DecodeStatus::kFailed:
    return "failed";
  }
  return "failed";
}

bool IsLibRawEnabledAtBuild() {
#if MEDIAPREP_ENABLE_LIBRAW
  return true;
#else
  return false;
#endif
}

std::string RawDecoderAvailabilityStatusText() {
#if MEDIAPREP_ENABLE_LIBRAW
  return "enabled (LibRaw " + LibRawVersionText() + ")";
#else
  return "disabled (build option OFF)";
#endif
}

std::unique_ptr<IRawDecoder> CreateRawDecoder() {
#if MEDIAPREP_ENABLE_LIBRAW
  return std::make_unique<LibRawDecoder>();
#else
  return std::make_unique<UnavailableRawDecoder>();
#endif
}

bool IsRawExtension(const std::filesystem::path& path) {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(kRawExtensions.begin(), kRawExtensions.end(), extension) !=
         kRawExtensions.end();
}

} // namespace mediaprep::raw
