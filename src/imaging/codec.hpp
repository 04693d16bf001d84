#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprep::imaging {

enum class OutputFormat {
  kJpeg = 0,
  kPng = 1,
  kWebp = 2,
};

// Accepts `jpg`, `jpeg`, `png` and `webp`, case-insensitively.
std::optional<OutputFormat> ParseOutputFormat(std::string_view raw);

// Canonical wire spelling (`jpg`, `png`, `webp`).
std::string_view ToString(OutputFormat format);

// File extension including the dot.
std::string_view FileExtension(OutputFormat format);

std::string_view MimeType(OutputFormat format);

// Encodes a BGR/BGRA/grayscale image. Non-8-bit input is scaled down to 8 bits
// first. `quality` (1..100) applies to JPEG and WebP; PNG is lossless and
// ignores it.
bool Encode(const cv::Mat& image, OutputFormat format, int quality,
            std::vector<unsigned char>& bytes, std::string& error);

// Decodes an in-memory JPEG/PNG/WebP/TIFF/BMP into a BGR image.
bool DecodeBytes(std::span<const unsigned char> bytes, cv::Mat& image, std::string& error);

// Decodes an image file. Fails (without throwing) when OpenCV cannot read the
// format, which lets callers try a RAW decoder next.
bool DecodeFile(const std::filesystem::path& path, cv::Mat& image, std::string& error);

} // namespace mediaprep::imaging
