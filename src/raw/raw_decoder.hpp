#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mediaprep::raw {

// How one decoder call ended. The extraction tiers key their fallback policy
// off this, so the distinction between "nothing to offer" and "the file is
// broken" has to be made here, next to the native error codes.
enum class DecodeStatus {
  kOk = 0,
  // Normal absence (no embedded thumbnail, unsupported thumbnail format).
  kAbsent = 1,
  // The decoder is not compiled into this build.
  kUnavailable = 2,
  // The source file is malformed, truncated or not a RAW file.
  kCorruptSource = 3,
  // Anything else: I/O, out of memory, internal decoder error.
  kFailed = 4,
};

std::string_view ToString(DecodeStatus status);

struct RawMetadata {
  std::string make;
  std::string model;
  std::string lens;
  double iso = 0.0;
  double aperture = 0.0;
  double shutter_speed = 0.0;
  double focal_length = 0.0;
  int width = 0;
  int height = 0;
  // Capture time, seconds since the epoch; unset when the file carries none.
  std::optional<std::int64_t> timestamp;
  // LibRaw flip code (0 none, 3 rotate 180, 5 rotate 90 CCW, 6 rotate 90 CW).
  int orientation = 0;
  std::map<std::string, std::string> extra;
};

// Native RAW decoder contract. Every method fills `image` with an 8-bit or
// 16-bit BGR cv::Mat on kOk and sets `message` otherwise.
class IRawDecoder {
public:
  virtual ~IRawDecoder() = default;

  // Short decoder name for logs and capability output.
  virtual std::string_view Name() const = 0;

  // Camera-embedded preview, already rotated to display orientation.
  virtual DecodeStatus TryEmbeddedPreview(const std::filesystem::path& path, cv::Mat& image,
                                          std::string& message) = 0;

  // Reduced-resolution (half-size) demosaic.
  virtual DecodeStatus DecodeReduced(const std::filesystem::path& path, cv::Mat& image,
                                     std::string& message) = 0;

  // Maximum-quality demosaic.
  virtual DecodeStatus DecodeFull(const std::filesystem::path& path, cv::Mat& image,
                                  std::string& message) = 0;

  virtual DecodeStatus ReadMetadata(const std::filesystem::path& path, RawMetadata& metadata,
                                    std::string& message) = 0;
};

// Returns whether LibRaw support is compiled into the current binary.
bool IsLibRawEnabledAtBuild();

// `enabled (LibRaw <version>)` or `disabled (build option OFF)`.
std::string RawDecoderAvailabilityStatusText();

// Creates the effective decoder for this build:
// - enabled builds: LibRaw-backed decoder
// - disabled builds: a decoder that answers kUnavailable to every call
std::unique_ptr<IRawDecoder> CreateRawDecoder();

// Extension-based RAW detection (`.cr2`, `.nef`, `.dng`, ...), case-insensitive.
bool IsRawExtension(const std::filesystem::path& path);

} // namespace mediaprep::raw
