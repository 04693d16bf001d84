#pragma once

#include <filesystem>
#include <string_view>

namespace mediaprep::media {

// Extension-based MIME detection, case-insensitive. Unknown extensions map to
// `application/octet-stream`.
std::string_view DetectMimeType(const std::filesystem::path& path);

} // namespace mediaprep::media
