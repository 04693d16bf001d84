#include "service/operations.hpp"

#include "accel/resizer.hpp"
#include "core/fs_utils.hpp"
#include "imaging/codec.hpp"
#include "media/ffmpeg_command.hpp"
#include "raw/extraction_tiers.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <utility>
#include <vector>

namespace mediaprep::service {

namespace {

using core::errors::ErrorKind;
using core::json::MakeBool;
using core::json::MakeNumber;
using core::json::MakeObject;
using core::json::MakeString;
using JsonValue = core::json::Value;

constexpr std::string_view kImagePreprocessInputSchema = R"json({
  "type": "object",
  "required": ["input_path", "output_path"],
  "additionalProperties": false,
  "properties": {
    "input_path": {"type": "string", "minLength": 1},
    "output_path": {"type": "string", "minLength": 1},
    "width": {"type": "integer", "minimum": 1, "maximum": 16384, "default": 336},
    "height": {"type": "integer", "minimum": 1, "maximum": 16384, "default": 336},
    "format": {"type": "string", "enum": ["jpg", "png", "webp"], "default": "jpg"},
    "quality": {"type": "integer", "minimum": 1, "maximum": 100, "default": 90},
    "keep_aspect": {"type": "boolean", "default": false,
                    "description": "Fit inside width x height instead of stretching"}
  }
})json";

constexpr std::string_view kImagePreprocessOutputSchema = R"json({
  "type": "object",
  "required": ["processed", "output_path", "width", "height", "format", "quality",
               "resize_backend"],
  "properties": {
    "processed": {"type": "boolean"},
    "output_path": {"type": "string"},
    "width": {"type": "integer"},
    "height": {"type": "integer"},
    "format": {"type": "string"},
    "quality": {"type": "integer"},
    "resize_backend": {"type": "string"},
    "source_tier": {"type": "string"}
  }
})json";

constexpr std::string_view kAudioPreprocessInputSchema = R"json({
  "type": "object",
  "required": ["input_path", "output_path"],
  "additionalProperties": false,
  "properties": {
    "input_path": {"type": "string", "minLength": 1},
    "output_path": {"type": "string", "minLength": 1},
    "sample_rate": {"type": "integer", "minimum": 8000, "maximum": 192000, "default": 48000},
    "channels": {"type": "integer", "minimum": 1, "maximum": 8, "default": 1},
    "format": {"type": "string", "enum": ["wav", "mp3", "flac"], "default": "wav"}
  }
})json";

constexpr std::string_view kAudioPreprocessOutputSchema = R"json({
  "type": "object",
  "required": ["processed", "output_path", "sample_rate", "channels", "format"],
  "properties": {
    "processed": {"type": "boolean"},
    "output_path": {"type": "string"},
    "sample_rate": {"type": "integer"},
    "channels": {"type": "integer"},
    "format": {"type": "string"}
  }
})json";

constexpr std::string_view kExtractFramesInputSchema = R"json({
  "type": "object",
  "required": ["video_path", "output_dir"],
  "additionalProperties": false,
  "properties": {
    "video_path": {"type": "string", "minLength": 1},
    "output_dir": {"type": "string", "minLength": 1},
    "fps": {"type": "integer", "minimum": 1, "maximum": 60, "default": 1},
    "width": {"type": "integer", "minimum": 1, "maximum": 16384, "default": 336},
    "height": {"type": "integer", "minimum": 1, "maximum": 16384, "default": 336},
    "max_frames": {"type": "integer", "minimum": 1, "maximum": 10000}
  }
})json";

constexpr std::string_view kExtractFramesOutputSchema = R"json({
  "type": "object",
  "required": ["extracted", "frame_count", "frames"],
  "properties": {
    "extracted": {"type": "boolean"},
    "frame_count": {"type": "integer"},
    "frames": {"type": "array", "items": {"type": "string"}}
  }
})json";

OperationError FromTranscodeError(const media::TranscodeError& transcode_error) {
  JsonValue details = MakeObject();
  if (!transcode_error.diagnostic.empty()) {
    details.Set("diagnostic", MakeString(transcode_error.diagnostic));
  }
  if (transcode_error.exit_code >= 0) {
    details.Set("exit_code", MakeNumber(transcode_error.exit_code));
  }
  return MakeOperationError(transcode_error.kind, transcode_error.message, std::move(details));
}

// Codec first; RAW files the codec cannot read go through the tier cascade.
bool LoadSourceImage(const OperationContext& context, const std::filesystem::path& source,
                     std::string_view request_id, cv::Mat& image,
                     std::optional<raw::ExtractionTier>& source_tier, OperationError& error) {
  std::string decode_error;
  if (imaging::DecodeFile(source, image, decode_error)) {
    return true;
  }
  if (!raw::IsRawExtension(source)) {
    error = MakeOperationError(ErrorKind::kProcessingError, decode_error);
    return false;
  }

  raw::ExtractionResult extraction;
  if (!raw::ExtractImage(context.decoder, source, false, extraction, context.logger,
                         request_id)) {
    error = MakeOperationError(ErrorKind::kNoUsablePreview,
                               "cannot decode '" + source.string() +
                                   "': " + raw::DescribeAttempts(extraction.attempts));
    return false;
  }
  image = std::move(extraction.image);
  source_tier = extraction.source_tier;
  return true;
}

bool HandleImagePreprocess(const OperationContext& context, const Request& request,
                           std::string_view request_id, HandlerResult& result,
                           OperationError& error) {
  const JsonValue& input = request.input;
  const std::filesystem::path source = core::json::GetString(input, "input_path");
  const std::filesystem::path output = core::json::GetString(input, "output_path");
  if (!detail::RequireExistingFile(source, "$.input_path", error)) {
    return false;
  }

  int box_width = 0;
  int box_height = 0;
  int quality = 0;
  if (!detail::ReadIntField(input, "width", 336, box_width, error) ||
      !detail::ReadIntField(input, "height", 336, box_height, error) ||
      !detail::ReadIntField(input, "quality", 90, quality, error)) {
    return false;
  }
  const bool keep_aspect = core::json::GetBool(input, "keep_aspect", false);
  const imaging::OutputFormat format =
      imaging::ParseOutputFormat(core::json::GetString(input, "format", "jpg"))
          .value_or(imaging::OutputFormat::kJpeg);

  cv::Mat image;
  std::optional<raw::ExtractionTier> source_tier;
  if (!LoadSourceImage(context, source, request_id, image, source_tier, error)) {
    return false;
  }

  accel::Dimensions target{box_width, box_height};
  if (keep_aspect) {
    target = accel::FitInsideBox(image.cols, image.rows, box_width, box_height);
  }

  cv::Mat resized;
  accel::ResizeReport report;
  std::string op_error;
  if (!accel::Resize(image, target.width, target.height, context.selector.ActiveBackend(),
                     resized, report, op_error)) {
    error = MakeOperationError(ErrorKind::kProcessingError, op_error);
    return false;
  }

  std::vector<unsigned char> bytes;
  if (!imaging::Encode(resized, format, quality, bytes, op_error) ||
      !core::WriteBytesFileAtomic(output, bytes, op_error)) {
    error = MakeOperationError(ErrorKind::kProcessingError, op_error);
    return false;
  }

  JsonValue out = MakeObject();
  out.Set("processed", MakeBool(true));
  out.Set("output_path", MakeString(output.string()));
  out.Set("width", MakeNumber(resized.cols));
  out.Set("height", MakeNumber(resized.rows));
  out.Set("format", MakeString(std::string(imaging::ToString(format))));
  out.Set("quality", MakeNumber(quality));
  out.Set("resize_backend", MakeString(std::string(accel::ToString(report.executed))));
  if (source_tier.has_value()) {
    out.Set("source_tier", MakeString(std::string(raw::ToString(*source_tier))));
  }
  result.output = std::move(out);
  return true;
}

bool HandleAudioPreprocess(const OperationContext& context, const Request& request,
                           std::string_view request_id, HandlerResult& result,
                           OperationError& error) {
  const JsonValue& input = request.input;
  const std::filesystem::path source = core::json::GetString(input, "input_path");
  const std::filesystem::path output = core::json::GetString(input, "output_path");
  if (!detail::RequireExistingFile(source, "$.input_path", error)) {
    return false;
  }

  media::AudioOptions options;
  if (!detail::ReadIntField(input, "sample_rate", 48000, options.sample_rate, error) ||
      !detail::ReadIntField(input, "channels", 1, options.channels, error)) {
    return false;
  }
  options.format = core::json::GetString(input, "format", "wav");

  media::TranscodeError transcode_error;
  if (!context.transcoder.PreprocessAudio(source, output, options, request_id,
                                          transcode_error)) {
    error = FromTranscodeError(transcode_error);
    return false;
  }

  JsonValue out = MakeObject();
  out.Set("processed", MakeBool(true));
  out.Set("output_path", MakeString(output.string()));
  out.Set("sample_rate", MakeNumber(options.sample_rate));
  out.Set("channels", MakeNumber(options.channels));
  out.Set("format", MakeString(options.format));
  result.output = std::move(out);
  return true;
}

bool HandleExtractFrames(const OperationContext& context, const Request& request,
                         std::string_view request_id, HandlerResult& result,
                         OperationError& error) {
  const JsonValue& input = request.input;
  const std::filesystem::path video = core::json::GetString(input, "video_path");
  const std::filesystem::path output_dir = core::json::GetString(input, "output_dir");
  if (!detail::RequireExistingFile(video, "$.video_path", error)) {
    return false;
  }

  media::FrameExtractionOptions options;
  if (!detail::ReadIntField(input, "fps", 1, options.fps, error) ||
      !detail::ReadIntField(input, "width", 336, options.width, error) ||
      !detail::ReadIntField(input, "height", 336, options.height, error) ||
      !detail::ReadIntField(input, "max_frames", 0, options.max_frames, error)) {
    return false;
  }

  std::vector<std::filesystem::path> frames;
  media::TranscodeError transcode_error;
  if (!context.transcoder.ExtractFrames(video, output_dir, options, request_id, frames,
                                        transcode_error)) {
    error = FromTranscodeError(transcode_error);
    return false;
  }

  JsonValue frame_list = core::json::MakeArray();
  for (const auto& frame : frames) {
    frame_list.Push(MakeString(frame.string()));
  }
  JsonValue out = MakeObject();
  out.Set("extracted", MakeBool(true));
  out.Set("frame_count", MakeNumber(static_cast<double>(frames.size())));
  out.Set("frames", std::move(frame_list));
  result.output = std::move(out);
  return true;
}

bool RegisterOne(OperationRouter& router, OperationSpec spec, std::string_view input_schema,
                 std::string_view output_schema, std::string& error) {
  if (!detail::ParseOperationSchema(spec.name, input_schema, spec.input_schema, error) ||
      !detail::ParseOperationSchema(spec.name, output_schema, spec.output_schema, error)) {
    return false;
  }
  return router.Register(std::move(spec), error);
}

} // namespace

bool RegisterMediaOperations(OperationRouter& router, const OperationContext& context,
                             std::string& error) {
  OperationSpec image;
  image.name = "image.preprocess";
  image.description =
      "Resize and re-encode an image for model input. RAW files are decoded through the "
      "preview tiers when the image codec cannot read them.";
  image.tags = {"image", "resize", "preprocess"};
  image.side_effects = {"reads input_path", "writes output_path"};
  image.idempotent = true;
  image.latency_target_ms = 100;
  image.examples = {
      {"Square 336 px model input",
       detail::ExampleInput(R"({"input_path": "/data/cat.png", "output_path": "/tmp/cat.jpg"})")},
      {"Aspect-preserving PNG thumbnail",
       detail::ExampleInput(R"({"input_path": "/data/scan.tiff", "output_path": )"
                            R"("/tmp/scan.png", "width": 512, "height": 512, "format": "png", )"
                            R"("keep_aspect": true})")},
  };
  image.handler = [&context](const Request& request, std::string_view request_id,
                             HandlerResult& result, OperationError& op_error) {
    return HandleImagePreprocess(context, request, request_id, result, op_error);
  };
  if (!RegisterOne(router, std::move(image), kImagePreprocessInputSchema,
                   kImagePreprocessOutputSchema, error)) {
    return false;
  }

  OperationSpec audio;
  audio.name = "audio.preprocess";
  audio.description = "Resample and remix an audio file with the external transcoder.";
  audio.tags = {"audio", "transcode", "preprocess"};
  audio.side_effects = {"reads input_path", "writes output_path", "spawns transcoder process"};
  audio.idempotent = true;
  audio.latency_target_ms = 2000;
  audio.examples = {
      {"16 kHz mono WAV for speech models",
       detail::ExampleInput(R"({"input_path": "/data/talk.m4a", "output_path": )"
                            R"("/tmp/talk.wav", "sample_rate": 16000, "channels": 1})")},
  };
  audio.handler = [&context](const Request& request, std::string_view request_id,
                             HandlerResult& result, OperationError& op_error) {
    return HandleAudioPreprocess(context, request, request_id, result, op_error);
  };
  if (!RegisterOne(router, std::move(audio), kAudioPreprocessInputSchema,
                   kAudioPreprocessOutputSchema, error)) {
    return false;
  }

  OperationSpec frames;
  frames.name = "video.extract_frames";
  frames.description = "Sample frames from a video at a fixed rate into numbered JPEG files.";
  frames.tags = {"video", "frames", "transcode"};
  frames.side_effects = {"reads video_path", "writes output_dir", "spawns transcoder process"};
  frames.idempotent = true;
  frames.latency_target_ms = 5000;
  frames.examples = {
      {"One frame per second, first ten frames",
       detail::ExampleInput(R"({"video_path": "/data/clip.mp4", "output_dir": "/tmp/frames", )"
                            R"("fps": 1, "max_frames": 10})")},
  };
  frames.handler = [&context](const Request& request, std::string_view request_id,
                              HandlerResult& result, OperationError& op_error) {
    return HandleExtractFrames(context, request, request_id, result, op_error);
  };
  return RegisterOne(router, std::move(frames), kExtractFramesInputSchema,
                     kExtractFramesOutputSchema, error);
}

} // namespace mediaprep::service
