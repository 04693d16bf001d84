#include "imaging/codec.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace mediaprep::imaging {

namespace {

std::string ToLower(std::string_view raw) {
  std::string lowered(raw);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

// 16-bit decodes (full RAW) are mapped to 8 bits; float images are assumed
// normalized to [0, 1].
bool ToEightBit(const cv::Mat& image, cv::Mat& converted, std::string& error) {
  switch (image.depth()) {
  case CV_8U:
    converted = image;
    return true;
  case CV_16U:
    image.convertTo(converted, CV_8U, 1.0 / 257.0);
    return true;
  case CV_32F:
  case CV_64F:
    image.convertTo(converted, CV_8U, 255.0);
    return true;
  default:
    error = "unsupported pixel depth for encoding (depth=" + std::to_string(image.depth()) + ")";
    return false;
  }
}

} // namespace

std::optional<OutputFormat> ParseOutputFormat(std::string_view raw) {
  const std::string lowered = ToLower(raw);
  if (lowered == "jpg" || lowered == "jpeg") {
    return OutputFormat::kJpeg;
  }
  if (lowered == "png") {
    return OutputFormat::kPng;
  }
  if (lowered == "webp") {
    return OutputFormat::kWebp;
  }
  return std::nullopt;
}

std::string_view ToString(OutputFormat format) {
  switch (format) {
  case OutputFormat::kJpeg:
    return "jpg";
  case OutputFormat::kPng:
    return "png";
  case OutputFormat::kWebp:
    return "webp";
  }
  return "jpg";
}

std::string_view FileExtension(OutputFormat format) {
  switch (format) {
  case OutputFormat::kJpeg:
    return ".jpg";
  case OutputFormat::kPng:
    return ".png";
  case OutputFormat::kWebp:
    return ".webp";
  }
  return ".jpg";
}

std::string_view MimeType(OutputFormat format) {
  switch (format) {
  case OutputFormat::kJpeg:
    return "image/jpeg";
  case OutputFormat::kPng:
    return "image/png";
  case OutputFormat::kWebp:
    return "image/webp";
  }
  return "application/octet-stream";
}

bool Encode(const cv::Mat& image, OutputFormat format, int quality,
            std::vector<unsigned char>& bytes, std::string& error) {
  if (image.empty()) {
    error = "cannot encode an empty image";
    return false;
  }

  cv::Mat eight_bit;
  if (!ToEightBit(image, eight_bit, error)) {
    return false;
  }

  const int clamped_quality = std::clamp(quality, 1, 100);
  std::vector<int> params;
  switch (format) {
  case OutputFormat::kJpeg:
    params = {cv::IMWRITE_JPEG_QUALITY, clamped_quality};
    break;
  case OutputFormat::kPng:
    params = {cv::IMWRITE_PNG_COMPRESSION, 3};
    break;
  case OutputFormat::kWebp:
    params = {cv::IMWRITE_WEBP_QUALITY, clamped_quality};
    break;
  }

  bytes.clear();
  try {
    if (!cv::imencode(FileExtension(format).data(), eight_bit, bytes, params)) {
      error = "image encoder rejected " + std::string(ToString(format)) + " output";
      return false;
    }
  } catch (const cv::Exception& ex) {
    error = std::string("image encode failed: ") + ex.what();
    return false;
  }
  return true;
}

bool DecodeBytes(std::span<const unsigned char> bytes, cv::Mat& image, std::string& error) {
  if (bytes.empty()) {
    error = "cannot decode an empty buffer";
    return false;
  }

  try {
    const cv::Mat buffer(1, static_cast<int>(bytes.size()), CV_8UC1,
                         const_cast<unsigned char*>(bytes.data()));
    image = cv::imdecode(buffer, cv::IMREAD_COLOR);
  } catch (const cv::Exception& ex) {
    error = std::string("image decode failed: ") + ex.what();
    return false;
  }

  if (image.empty()) {
    error = "buffer is not a decodable image";
    return false;
  }
  return true;
}

bool DecodeFile(const std::filesystem::path& path, cv::Mat& image, std::string& error) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    error = "input file not found: " + path.string();
    return false;
  }

  try {
    image = cv::imread(path.string(), cv::IMREAD_COLOR);
  } catch (const cv::Exception& ex) {
    error = std::string("image decode failed: ") + ex.what();
    return false;
  }

  if (image.empty()) {
    error = "unsupported or corrupt image file: " + path.string();
    return false;
  }
  return true;
}

} // namespace mediaprep::imaging
