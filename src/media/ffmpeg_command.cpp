#include "media/ffmpeg_command.hpp"

#include <utility>

namespace mediaprep::media {

FfmpegCommand::FfmpegCommand(std::string binary) {
  argv_.push_back(std::move(binary));
}

FfmpegCommand& FfmpegCommand::Overwrite() {
  argv_.emplace_back("-y");
  return *this;
}

FfmpegCommand& FfmpegCommand::Input(const std::filesystem::path& path) {
  argv_.emplace_back("-i");
  argv_.push_back(path.string());
  return *this;
}

FfmpegCommand& FfmpegCommand::Arg(std::string arg) {
  argv_.push_back(std::move(arg));
  return *this;
}

FfmpegCommand& FfmpegCommand::Args(std::initializer_list<std::string> args) {
  argv_.insert(argv_.end(), args.begin(), args.end());
  return *this;
}

FfmpegCommand& FfmpegCommand::Output(const std::filesystem::path& path) {
  argv_.push_back(path.string());
  return *this;
}

std::string FfmpegCommand::ToDisplayString() const {
  std::string out;
  for (const auto& arg : argv_) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

FfmpegCommand BuildAudioCommand(const std::string& binary, const std::filesystem::path& input,
                                const std::filesystem::path& output,
                                const AudioOptions& options) {
  FfmpegCommand command(binary);
  command.Overwrite()
      .Input(input)
      .Args({"-ar", std::to_string(options.sample_rate)})
      .Args({"-ac", std::to_string(options.channels)})
      .Args({"-f", options.format})
      .Output(output);
  return command;
}

FfmpegCommand BuildFrameExtractionCommand(const std::string& binary,
                                          const std::filesystem::path& video,
                                          const std::filesystem::path& output_dir,
                                          const FrameExtractionOptions& options) {
  FfmpegCommand command(binary);
  command.Overwrite()
      .Input(video)
      .Args({"-vf", "fps=" + std::to_string(options.fps) + ",scale=" +
                        std::to_string(options.width) + ":" + std::to_string(options.height)})
      .Args({"-f", "image2"});
  if (options.max_frames > 0) {
    command.Args({"-frames:v", std::to_string(options.max_frames)});
  }
  command.Output(output_dir / "frame_%04d.jpg");
  return command;
}

} // namespace mediaprep::media
