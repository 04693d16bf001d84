#include "common/assertions.hpp"
#include "common/temp_dir.hpp"
#include "media/ffmpeg_command.hpp"
#include "media/mime_types.hpp"
#include "media/process_runner.hpp"
#include "media/transcoder.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using mediaprep::core::errors::ErrorKind;
using mediaprep::tests::common::AssertContains;
using mediaprep::tests::common::AssertNotContains;
using mediaprep::tests::common::CreateUniqueTempDir;
using mediaprep::tests::common::Fail;
using mediaprep::tests::common::RemovePathBestEffort;
using mediaprep::tests::common::WriteExecutableScript;
using mediaprep::tests::common::WriteFixtureFile;

int main() {
  // Argument lists match the documented transcoder invocations.
  {
    mediaprep::media::AudioOptions audio;
    audio.sample_rate = 16000;
    const auto command =
        mediaprep::media::BuildAudioCommand("ffmpeg", "in file.m4a", "/tmp/out.wav", audio);
    if (command.ToDisplayString() !=
        "ffmpeg -y -i in file.m4a -ar 16000 -ac 1 -f wav /tmp/out.wav") {
      Fail("unexpected audio command: " + command.ToDisplayString());
    }
    if (command.argv().size() != 11U || command.argv()[3] != "in file.m4a") {
      Fail("paths with spaces must stay one argv entry");
    }

    mediaprep::media::FrameExtractionOptions frames;
    frames.fps = 2;
    frames.max_frames = 5;
    const auto extract = mediaprep::media::BuildFrameExtractionCommand("ffmpeg", "clip.mp4",
                                                                       "/tmp/frames", frames);
    AssertContains(extract.ToDisplayString(), "-vf fps=2,scale=336:336 -f image2");
    AssertContains(extract.ToDisplayString(), "-frames:v 5");
    AssertContains(extract.ToDisplayString(), "/tmp/frames/frame_%04d.jpg");

    frames.max_frames = 0;
    AssertNotContains(mediaprep::media::BuildFrameExtractionCommand("ffmpeg", "clip.mp4",
                                                                    "/tmp/frames", frames)
                          .ToDisplayString(),
                      "-frames:v");
  }

  if (mediaprep::media::DetectMimeType("IMG_0001.CR2") != "image/x-canon-cr2" ||
      mediaprep::media::DetectMimeType("clip.MOV") != "video/quicktime" ||
      mediaprep::media::DetectMimeType("unknown.bin") != "application/octet-stream") {
    Fail("unexpected mime type detection");
  }

  if (mediaprep::media::TailLines("a\nb\nc\nd\n", 2) != "c\nd") {
    Fail("expected TailLines to keep the last lines: '" +
         mediaprep::media::TailLines("a\nb\nc\nd\n", 2) + "'");
  }

  const fs::path root = CreateUniqueTempDir("mediaprep-transcoder-smoke");
  const fs::path input = root / "input.mp4";
  WriteFixtureFile(input, "not really a video");

  // Missing binary.
  {
    const mediaprep::media::Transcoder transcoder((root / "no-such-ffmpeg").string());
    mediaprep::media::TranscodeError error;
    if (transcoder.PreprocessAudio(input, root / "out.wav", {}, "t", error)) {
      Fail("expected a missing transcoder binary to fail");
    }
    if (error.kind != ErrorKind::kExternalToolFailure || error.diagnostic.empty()) {
      Fail("expected ExternalToolFailure with a diagnostic for a missing binary");
    }
  }

  // Missing input is a processing error and never spawns anything.
  {
    const mediaprep::media::Transcoder transcoder("/bin/false");
    mediaprep::media::TranscodeError error;
    if (transcoder.PreprocessAudio(root / "absent.wav", root / "out.wav", {}, "t", error) ||
        error.kind != ErrorKind::kProcessingError) {
      Fail("expected ProcessingError for a missing input");
    }
  }

  // Nonzero exit keeps the stderr tail.
  {
    const fs::path failing = WriteExecutableScript(
        root, "failing-ffmpeg",
        "echo 'Input #0, mov,mp4' >&2\necho 'moov atom not found' >&2\nexit 3\n");
    const mediaprep::media::Transcoder transcoder(failing.string());
    mediaprep::media::TranscodeError error;
    if (transcoder.PreprocessAudio(input, root / "out.wav", {}, "t", error)) {
      Fail("expected nonzero exit to fail");
    }
    if (error.kind != ErrorKind::kExternalToolFailure || error.exit_code != 3) {
      Fail("expected ExternalToolFailure with exit_code 3");
    }
    AssertContains(error.diagnostic, "moov atom not found");
  }

  // Successful extraction lists the produced frames in order.
  {
    const fs::path fake = WriteExecutableScript(root, "frames-ffmpeg",
                                      "for last; do :; done\n"
                                      "dir=$(dirname \"$last\")\n"
                                      "touch \"$dir/frame_0002.jpg\" \"$dir/frame_0001.jpg\" "
                                      "\"$dir/notes.txt\"\n");
    const mediaprep::media::Transcoder transcoder(fake.string());
    std::vector<fs::path> frames;
    mediaprep::media::TranscodeError error;
    if (!transcoder.ExtractFrames(input, root / "frames", {}, "t", frames, error)) {
      Fail("expected frame extraction to succeed: " + error.message);
    }
    if (frames.size() != 2U || frames.front().filename() != "frame_0001.jpg") {
      Fail("expected two sorted frame files");
    }
  }

  // A reused directory only reports this run's frames, capped at max_frames
  // and ending at the first gap.
  {
    const fs::path out_dir = root / "reused";
    fs::create_directories(out_dir);
    WriteFixtureFile(out_dir / "frame_0007.jpg", "stale");
    WriteFixtureFile(out_dir / "keep.txt", "unrelated");
    const fs::path fake = WriteExecutableScript(root, "three-frames-ffmpeg",
                                      "for last; do :; done\n"
                                      "dir=$(dirname \"$last\")\n"
                                      "touch \"$dir/frame_0001.jpg\" \"$dir/frame_0002.jpg\" "
                                      "\"$dir/frame_0003.jpg\" \"$dir/frame_0005.jpg\"\n");
    const mediaprep::media::Transcoder transcoder(fake.string());
    std::vector<fs::path> frames;
    mediaprep::media::TranscodeError error;
    if (!transcoder.ExtractFrames(input, out_dir, {}, "t", frames, error)) {
      Fail("expected frame extraction to succeed: " + error.message);
    }
    if (frames.size() != 3U || frames.back().filename() != "frame_0003.jpg") {
      Fail("expected the frame sequence to stop at the first missing index");
    }
    if (fs::exists(out_dir / "frame_0007.jpg") || !fs::exists(out_dir / "keep.txt")) {
      Fail("expected only stale frame files to be removed before extraction");
    }

    mediaprep::media::FrameExtractionOptions capped;
    capped.max_frames = 2;
    if (!transcoder.ExtractFrames(input, out_dir, capped, "t", frames, error)) {
      Fail("expected capped frame extraction to succeed: " + error.message);
    }
    if (frames.size() != 2U) {
      Fail("expected max_frames to cap the reported frames");
    }
  }

  // Short children are not held up by unrelated children forked at the same
  // time from other threads.
  {
    std::atomic<bool> stop{false};
    std::vector<std::thread> sleepers;
    for (int i = 0; i < 16; ++i) {
      sleepers.emplace_back([&stop] {
        while (!stop.load()) {
          mediaprep::media::ProcessResult result;
          std::string error;
          if (!mediaprep::media::RunProcess({"sleep", "1"}, result, error)) {
            Fail("failed to run sleep: " + error);
          }
        }
      });
    }

    std::int64_t worst_ms = 0;
    for (int i = 0; i < 1000; ++i) {
      const auto started = std::chrono::steady_clock::now();
      mediaprep::media::ProcessResult result;
      std::string error;
      if (!mediaprep::media::RunProcess({"true"}, result, error) || result.exit_code != 0) {
        Fail("failed to run true: " + error);
      }
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      worst_ms = std::max<std::int64_t>(worst_ms, elapsed.count());
    }
    stop.store(true);
    for (auto& sleeper : sleepers) {
      sleeper.join();
    }
    if (worst_ms >= 900) {
      Fail("a short child waited " + std::to_string(worst_ms) + " ms on an unrelated child");
    }
  }

  RemovePathBestEffort(root);
  std::cout << "transcoder_smoke: ok\n";
  return 0;
}
