#pragma once

#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

namespace mediaprep::media {

// Argument-list builder for the external transcoder. Nothing is quoted or
// passed through a shell; each element becomes one argv entry.
class FfmpegCommand {
public:
  explicit FfmpegCommand(std::string binary = "ffmpeg");

  // Adds `-y` so reruns overwrite outputs instead of prompting.
  FfmpegCommand& Overwrite();
  FfmpegCommand& Input(const std::filesystem::path& path);
  FfmpegCommand& Arg(std::string arg);
  FfmpegCommand& Args(std::initializer_list<std::string> args);
  FfmpegCommand& Output(const std::filesystem::path& path);

  const std::vector<std::string>& argv() const {
    return argv_;
  }

  // Space-joined rendering for logs. Not meant to be executed.
  std::string ToDisplayString() const;

private:
  std::vector<std::string> argv_;
};

struct AudioOptions {
  int sample_rate = 48000;
  int channels = 1;
  std::string format = "wav";
};

struct FrameExtractionOptions {
  int fps = 1;
  int width = 336;
  int height = 336;
  // 0 means no limit.
  int max_frames = 0;
};

// `-y -i <in> -ar <rate> -ac <ch> -f <fmt> <out>`
FfmpegCommand BuildAudioCommand(const std::string& binary, const std::filesystem::path& input,
                                const std::filesystem::path& output,
                                const AudioOptions& options);

// `-y -i <in> -vf fps=<f>,scale=<w>:<h> -f image2 [-frames:v <n>] <dir>/frame_%04d.jpg`
FfmpegCommand BuildFrameExtractionCommand(const std::string& binary,
                                          const std::filesystem::path& video,
                                          const std::filesystem::path& output_dir,
                                          const FrameExtractionOptions& options);

} // namespace mediaprep::media
