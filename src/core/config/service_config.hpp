#pragma once

#include "accel/backend.hpp"
#include "core/logging/logger.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprep::core::config {

inline constexpr std::string_view kDefaultSocketPath = "/tmp/mediaprep.sock";
inline constexpr std::string_view kDefaultFfmpegPath = "ffmpeg";
inline constexpr int kDefaultPreviewQuality = 92;
inline constexpr int kDefaultPreviewMaxDimension = 2048;
inline constexpr std::size_t kDefaultMaxFrameBytes = 64U * 1024U * 1024U;

// Everything a running service needs to know. Built from defaults, then the
// environment, then CLI flags, each layer overriding the previous one.
struct ServiceConfig {
  std::string socket_path = std::string(kDefaultSocketPath);
  std::size_t worker_count = 1;
  logging::LogLevel log_level = logging::LogLevel::kInfo;
  // Ordered probe candidates. `reference` is appended by the selector when
  // missing, so an empty list means "CPU only".
  std::vector<accel::Backend> accel_candidates;
  std::string ffmpeg_path = std::string(kDefaultFfmpegPath);
  int preview_quality = kDefaultPreviewQuality;
  int preview_max_dimension = kDefaultPreviewMaxDimension;
  std::size_t max_frame_bytes = kDefaultMaxFrameBytes;
};

// Defaults: hardware-concurrency workers (at least 1) and the full
// cuda,vulkan,opencl candidate list.
ServiceConfig DefaultServiceConfig();

// Environment lookup seam so tests do not have to mutate the real process
// environment. Returns nullptr for unset variables.
using EnvLookup = std::function<const char*(const char*)>;

EnvLookup ProcessEnvLookup();

// Applies MEDIAPREP_SOCKET, MEDIAPREP_ACCEL, MEDIAPREP_FFMPEG,
// MEDIAPREP_LOG_LEVEL and MEDIAPREP_WORKERS. Empty values are ignored.
bool ApplyEnvironment(ServiceConfig& config, const EnvLookup& lookup, std::string& error);

// Parses a comma-separated candidate list such as `cuda,opencl`. Whitespace
// around names is ignored; duplicates and unknown names are rejected.
bool ParseAccelList(std::string_view raw, std::vector<accel::Backend>& candidates,
                    std::string& error);

// Strict positive integer parse used by `--workers` and MEDIAPREP_WORKERS.
bool ParseWorkerCount(std::string_view raw, std::size_t& worker_count, std::string& error);

// Human-readable `cuda,vulkan,opencl,reference` rendering for logs and CLI.
std::string FormatAccelList(const std::vector<accel::Backend>& candidates);

} // namespace mediaprep::core::config
