#pragma once

#include "core/errors/error_kind.hpp"
#include "core/logging/logger.hpp"
#include "media/ffmpeg_command.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprep::media {

struct TranscodeError {
  core::errors::ErrorKind kind = core::errors::ErrorKind::kExternalToolFailure;
  std::string message;
  // Tail of the transcoder's stderr, empty when it never ran.
  std::string diagnostic;
  int exit_code = -1;
};

// File-in/file-out wrapper around the external transcoder binary. Stateless
// apart from the binary path, so one instance serves all workers.
class Transcoder {
public:
  explicit Transcoder(std::string binary, core::logging::Logger* logger = nullptr);

  const std::string& binary() const {
    return binary_;
  }

  bool PreprocessAudio(const std::filesystem::path& input, const std::filesystem::path& output,
                       const AudioOptions& options, std::string_view request_id,
                       TranscodeError& error) const;

  // Writes frame_0001.jpg, frame_0002.jpg, ... into `output_dir` (created when
  // missing) and returns them in order in `frames`. Frame files already in the
  // directory are removed first; at most `max_frames` are returned when set.
  bool ExtractFrames(const std::filesystem::path& video, const std::filesystem::path& output_dir,
                     const FrameExtractionOptions& options, std::string_view request_id,
                     std::vector<std::filesystem::path>& frames, TranscodeError& error) const;

private:
  bool Execute(const FfmpegCommand& command, std::string_view request_id,
               TranscodeError& error) const;

  std::string binary_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace mediaprep::media
