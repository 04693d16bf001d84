#include "media/transcoder.hpp"

#include "core/fs_utils.hpp"
#include "media/process_runner.hpp"

#include <cstdio>
#include <system_error>
#include <utility>

namespace mediaprep::media {

namespace {

constexpr std::size_t kDiagnosticLines = 12;

bool RequireInputFile(const std::filesystem::path& input, TranscodeError& error) {
  std::error_code ec;
  if (std::filesystem::is_regular_file(input, ec) && !ec) {
    return true;
  }
  error.kind = core::errors::ErrorKind::kProcessingError;
  error.message = "input file not found: " + input.string();
  return false;
}

// Matches the `frame_%04d.jpg` pattern the extraction command writes.
std::filesystem::path FramePath(const std::filesystem::path& dir, int index) {
  char name[32];
  std::snprintf(name, sizeof(name), "frame_%04d.jpg", index);
  return dir / name;
}

bool IsFrameFileName(const std::string& name) {
  if (name.size() < 14U || name.rfind("frame_", 0) != 0U ||
      name.compare(name.size() - 4U, 4U, ".jpg") != 0) {
    return false;
  }
  for (std::size_t i = 6; i < name.size() - 4U; ++i) {
    if (name[i] < '0' || name[i] > '9') {
      return false;
    }
  }
  return true;
}

// Frames left by an earlier run in the same directory would otherwise be
// reported as part of this one.
bool RemoveStaleFrames(const std::filesystem::path& dir, std::string& error) {
  std::error_code ec;
  std::vector<std::filesystem::path> stale;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (IsFrameFileName(entry.path().filename().string())) {
      stale.push_back(entry.path());
    }
  }
  if (ec) {
    error = "failed to list output directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  for (const auto& path : stale) {
    std::filesystem::remove(path, ec);
    if (ec) {
      error = "failed to remove stale frame '" + path.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

} // namespace

Transcoder::Transcoder(std::string binary, core::logging::Logger* logger)
    : binary_(std::move(binary)), logger_(logger) {}

bool Transcoder::PreprocessAudio(const std::filesystem::path& input,
                                 const std::filesystem::path& output,
                                 const AudioOptions& options, std::string_view request_id,
                                 TranscodeError& error) const {
  error = TranscodeError{};
  if (!RequireInputFile(input, error)) {
    return false;
  }

  std::string dir_error;
  if (!core::EnsureParentDirectory(output, dir_error)) {
    error.kind = core::errors::ErrorKind::kProcessingError;
    error.message = dir_error;
    return false;
  }

  return Execute(BuildAudioCommand(binary_, input, output, options), request_id, error);
}

bool Transcoder::ExtractFrames(const std::filesystem::path& video,
                               const std::filesystem::path& output_dir,
                               const FrameExtractionOptions& options,
                               std::string_view request_id,
                               std::vector<std::filesystem::path>& frames,
                               TranscodeError& error) const {
  error = TranscodeError{};
  frames.clear();
  if (!RequireInputFile(video, error)) {
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    error.kind = core::errors::ErrorKind::kProcessingError;
    error.message =
        "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }

  std::string cleanup_error;
  if (!RemoveStaleFrames(output_dir, cleanup_error)) {
    error.kind = core::errors::ErrorKind::kProcessingError;
    error.message = cleanup_error;
    return false;
  }

  if (!Execute(BuildFrameExtractionCommand(binary_, video, output_dir, options), request_id,
               error)) {
    return false;
  }

  // Numbering starts at 1 and is contiguous; the first gap ends the sequence.
  for (int index = 1; options.max_frames <= 0 || index <= options.max_frames; ++index) {
    std::filesystem::path frame = FramePath(output_dir, index);
    if (!std::filesystem::is_regular_file(frame, ec)) {
      break;
    }
    frames.push_back(std::move(frame));
  }
  return true;
}

bool Transcoder::Execute(const FfmpegCommand& command, std::string_view request_id,
                         TranscodeError& error) const {
  if (logger_ != nullptr) {
    logger_->Log(core::logging::LogLevel::kDebug, request_id, "transcoder_exec",
                 {{"command", command.ToDisplayString()}});
  }

  ProcessResult process;
  std::string run_error;
  if (!RunProcess(command.argv(), process, run_error)) {
    error.kind = core::errors::ErrorKind::kExternalToolFailure;
    error.message = "transcoder could not be started: " + run_error;
    error.diagnostic = run_error;
    return false;
  }

  if (process.exit_code != 0) {
    error.kind = core::errors::ErrorKind::kExternalToolFailure;
    error.exit_code = process.exit_code;
    error.message = "transcoder exited with status " + std::to_string(process.exit_code);
    error.diagnostic = TailLines(process.output, kDiagnosticLines);
    if (logger_ != nullptr) {
      logger_->Log(core::logging::LogLevel::kWarn, request_id, "transcoder_failed",
                   {{"exit_code", std::to_string(process.exit_code)},
                    {"diagnostic", error.diagnostic}});
    }
    return false;
  }
  return true;
}

} // namespace mediaprep::media
