#include "media/mime_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace mediaprep::media {

namespace {

using MimeEntry = std::pair<std::string_view, std::string_view>;

constexpr std::array<MimeEntry, 43> kMimeTable = {{
    {"jpg", "image/jpeg"},          {"jpeg", "image/jpeg"},
    {"png", "image/png"},           {"gif", "image/gif"},
    {"webp", "image/webp"},         {"tif", "image/tiff"},
    {"tiff", "image/tiff"},         {"bmp", "image/bmp"},
    {"heic", "image/heic"},         {"heif", "image/heic"},
    {"avif", "image/avif"},         {"cr2", "image/x-canon-cr2"},
    {"cr3", "image/x-canon-cr3"},   {"crw", "image/x-canon-crw"},
    {"nef", "image/x-nikon-nef"},   {"nrw", "image/x-nikon-nrw"},
    {"arw", "image/x-sony-arw"},    {"dng", "image/x-adobe-dng"},
    {"raf", "image/x-fuji-raf"},    {"orf", "image/x-olympus-orf"},
    {"rw2", "image/x-panasonic-rw2"}, {"pef", "image/x-pentax-pef"},
    {"srw", "image/x-samsung-srw"}, {"x3f", "image/x-sigma-x3f"},
    {"mp4", "video/mp4"},           {"m4v", "video/mp4"},
    {"mov", "video/quicktime"},     {"avi", "video/x-msvideo"},
    {"mkv", "video/x-matroska"},    {"webm", "video/webm"},
    {"wmv", "video/x-ms-wmv"},      {"flv", "video/x-flv"},
    {"mp3", "audio/mpeg"},          {"wav", "audio/wav"},
    {"flac", "audio/flac"},         {"aac", "audio/aac"},
    {"ogg", "audio/ogg"},           {"m4a", "audio/mp4"},
    {"wma", "audio/x-ms-wma"},      {"pdf", "application/pdf"},
    {"json", "application/json"},   {"xml", "application/xml"},
    {"svg", "image/svg+xml"},
}};

} // namespace

std::string_view DetectMimeType(const std::filesystem::path& path) {
  std::string extension = path.extension().string();
  if (!extension.empty() && extension.front() == '.') {
    extension.erase(0, 1);
  }
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  const auto it = std::find_if(kMimeTable.begin(), kMimeTable.end(),
                               [&extension](const MimeEntry& entry) {
                                 return entry.first == extension;
                               });
  return it == kMimeTable.end() ? std::string_view("application/octet-stream") : it->second;
}

} // namespace mediaprep::media
