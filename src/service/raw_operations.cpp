#include "service/operations.hpp"

#include "core/base64.hpp"
#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "imaging/codec.hpp"
#include "media/mime_types.hpp"

#include <chrono>
#include <ctime>
#include <span>
#include <utility>

namespace mediaprep::service {

namespace {

using core::errors::ErrorKind;
using core::json::MakeNumber;
using core::json::MakeObject;
using core::json::MakeString;
using JsonValue = core::json::Value;

constexpr std::string_view kRawPreviewInputSchema = R"json({
  "type": "object",
  "required": ["input_path"],
  "additionalProperties": false,
  "properties": {
    "input_path": {"type": "string", "minLength": 1, "description": "RAW file to preview"},
    "output_path": {"type": "string", "minLength": 1,
                    "description": "Write the preview here; omit to receive data_base64"},
    "quality": {"type": "integer", "minimum": 1, "maximum": 100, "default": 92},
    "max_dimension": {"type": "integer", "minimum": 16, "maximum": 16384, "default": 2048,
                      "description": "Longest side of the output in pixels"},
    "format": {"type": "string", "enum": ["jpg", "png", "webp"], "default": "webp"},
    "force_highest_tier": {"type": "boolean", "default": false,
                           "description": "Skip embedded previews and run a full decode"}
  }
})json";

constexpr std::string_view kRawPreviewOutputSchema = R"json({
  "type": "object",
  "required": ["width", "height", "format", "quality", "bytes", "source_tier",
               "tiers_attempted", "resize_backend"],
  "properties": {
    "width": {"type": "integer"},
    "height": {"type": "integer"},
    "format": {"type": "string", "enum": ["jpg", "png", "webp"]},
    "mime_type": {"type": "string"},
    "quality": {"type": "integer"},
    "bytes": {"type": "integer"},
    "source_tier": {"type": "string", "enum": ["EmbeddedPreview", "FastDecode", "FullDecode"]},
    "tiers_attempted": {"type": "array", "items": {"type": "object"}},
    "resize_backend": {"type": "string"},
    "resize_fallback_reason": {"type": "string"},
    "output_path": {"type": "string"},
    "data_base64": {"type": "string"}
  }
})json";

constexpr std::string_view kRawMetadataInputSchema = R"json({
  "type": "object",
  "required": ["input_path"],
  "additionalProperties": false,
  "properties": {
    "input_path": {"type": "string", "minLength": 1, "description": "RAW file to inspect"}
  }
})json";

constexpr std::string_view kRawMetadataOutputSchema = R"json({
  "type": "object",
  "required": ["make", "model", "width", "height", "mime_type"],
  "properties": {
    "make": {"type": "string"},
    "model": {"type": "string"},
    "lens": {"type": ["string", "null"]},
    "iso": {"type": "number"},
    "aperture": {"type": "number"},
    "shutter_speed": {"type": "number"},
    "focal_length": {"type": "number"},
    "width": {"type": "integer"},
    "height": {"type": "integer"},
    "timestamp": {"type": ["string", "null"]},
    "orientation": {"type": "integer"},
    "mime_type": {"type": "string"},
    "extra": {"type": "object"}
  }
})json";

JsonValue AttemptsToJson(const std::vector<raw::TierAttempt>& attempts) {
  JsonValue out = core::json::MakeArray();
  for (const raw::TierAttempt& attempt : attempts) {
    JsonValue entry = MakeObject();
    entry.Set("tier", MakeString(std::string(raw::ToString(attempt.tier))));
    entry.Set("outcome", MakeString(std::string(raw::ToString(attempt.outcome))));
    if (!attempt.reason.empty()) {
      entry.Set("reason", MakeString(attempt.reason));
    }
    out.Push(std::move(entry));
  }
  return out;
}

bool HandleRawPreview(const OperationContext& context, const Request& request,
                      std::string_view request_id, HandlerResult& result,
                      OperationError& error) {
  const JsonValue& input = request.input;
  const std::filesystem::path source = core::json::GetString(input, "input_path");
  if (!detail::RequireExistingFile(source, "$.input_path", error)) {
    return false;
  }

  raw::PreviewOptions options;
  if (!detail::ReadIntField(input, "quality", context.config.preview_quality, options.quality,
                            error) ||
      !detail::ReadIntField(input, "max_dimension", context.config.preview_max_dimension,
                            options.max_dimension, error)) {
    return false;
  }
  options.force_highest_tier = core::json::GetBool(input, "force_highest_tier", false);
  options.format = imaging::ParseOutputFormat(core::json::GetString(input, "format", "webp"))
                       .value_or(imaging::OutputFormat::kWebp);

  raw::PreviewResult preview;
  raw::PreviewError preview_error;
  if (!context.preview.Run(source, options, request_id, preview, preview_error)) {
    JsonValue details = MakeObject();
    details.Set("input_path", MakeString(source.string()));
    details.Set("tiers_attempted", AttemptsToJson(preview_error.attempts));
    error = MakeOperationError(preview_error.kind, preview_error.message, std::move(details));
    return false;
  }

  JsonValue out = MakeObject();
  out.Set("width", MakeNumber(preview.width));
  out.Set("height", MakeNumber(preview.height));
  out.Set("format", MakeString(std::string(imaging::ToString(preview.format))));
  out.Set("mime_type", MakeString(std::string(imaging::MimeType(preview.format))));
  out.Set("quality", MakeNumber(preview.quality));
  out.Set("bytes", MakeNumber(static_cast<double>(preview.bytes.size())));
  out.Set("source_tier", MakeString(std::string(raw::ToString(preview.source_tier))));
  out.Set("tiers_attempted", AttemptsToJson(preview.attempts));
  out.Set("resize_backend", MakeString(std::string(accel::ToString(preview.resize.executed))));
  if (preview.resize.fell_back()) {
    out.Set("resize_fallback_reason", MakeString(preview.resize.fallback_reason));
  }

  const std::string output_path = core::json::GetString(input, "output_path");
  if (!output_path.empty()) {
    std::string write_error;
    if (!core::WriteBytesFileAtomic(output_path, preview.bytes, write_error)) {
      error = MakeOperationError(ErrorKind::kProcessingError, write_error);
      return false;
    }
    out.Set("output_path", MakeString(output_path));
  } else {
    out.Set("data_base64", MakeString(core::EncodeBase64(preview.bytes)));
  }

  result.output = std::move(out);
  result.cost = raw::RelativeCost(preview.source_tier);
  return true;
}

bool HandleRawMetadata(const OperationContext& context, const Request& request,
                       std::string_view /*request_id*/, HandlerResult& result,
                       OperationError& error) {
  const std::filesystem::path source = core::json::GetString(request.input, "input_path");
  if (!detail::RequireExistingFile(source, "$.input_path", error)) {
    return false;
  }

  raw::RawMetadata metadata;
  std::string message;
  const raw::DecodeStatus status = context.decoder.ReadMetadata(source, metadata, message);
  if (status != raw::DecodeStatus::kOk) {
    JsonValue details = MakeObject();
    details.Set("input_path", MakeString(source.string()));
    details.Set("decoder", MakeString(std::string(context.decoder.Name())));
    details.Set("status", MakeString(std::string(raw::ToString(status))));
    details.Set("diagnostic", MakeString(message));
    error = MakeOperationError(ErrorKind::kExternalToolFailure,
                               "RAW decoder rejected '" + source.string() + "'",
                               std::move(details));
    return false;
  }

  JsonValue out = MakeObject();
  out.Set("make", MakeString(metadata.make));
  out.Set("model", MakeString(metadata.model));
  out.Set("lens", metadata.lens.empty() ? core::json::MakeNull() : MakeString(metadata.lens));
  out.Set("iso", MakeNumber(metadata.iso));
  out.Set("aperture", MakeNumber(metadata.aperture));
  out.Set("shutter_speed", MakeNumber(metadata.shutter_speed));
  out.Set("focal_length", MakeNumber(metadata.focal_length));
  out.Set("width", MakeNumber(metadata.width));
  out.Set("height", MakeNumber(metadata.height));
  out.Set("orientation", MakeNumber(metadata.orientation));
  out.Set("mime_type", MakeString(std::string(media::DetectMimeType(source))));
  if (metadata.timestamp.has_value()) {
    out.Set("timestamp", MakeString(core::FormatUtcTimestamp(
                             std::chrono::system_clock::from_time_t(
                                 static_cast<std::time_t>(*metadata.timestamp)))));
  } else {
    out.Set("timestamp", core::json::MakeNull());
  }

  JsonValue extra = MakeObject();
  for (const auto& [key, value] : metadata.extra) {
    extra.Set(key, MakeString(value));
  }
  out.Set("extra", std::move(extra));

  result.output = std::move(out);
  return true;
}

} // namespace

bool RegisterRawOperations(OperationRouter& router, const OperationContext& context,
                           std::string& error) {
  OperationSpec preview;
  preview.name = "raw.preview";
  preview.description =
      "Produce a compressed preview from a RAW photo, preferring the camera-embedded preview "
      "and falling back to reduced and full decodes.";
  preview.tags = {"raw", "preview", "image"};
  preview.side_effects = {"reads input_path", "writes output_path when provided"};
  preview.idempotent = true;
  preview.latency_target_ms = 250;
  if (!detail::ParseOperationSchema(preview.name, kRawPreviewInputSchema, preview.input_schema,
                                    error) ||
      !detail::ParseOperationSchema(preview.name, kRawPreviewOutputSchema,
                                    preview.output_schema, error)) {
    return false;
  }
  detail::SetPropertyDefault(preview.input_schema, "quality",
                             MakeNumber(context.config.preview_quality));
  detail::SetPropertyDefault(preview.input_schema, "max_dimension",
                             MakeNumber(context.config.preview_max_dimension));
  preview.examples = {
      {"WebP preview written next to the source",
       detail::ExampleInput(R"({"input_path": "/photos/IMG_0001.CR2", "output_path": )"
                            R"("/photos/IMG_0001.webp", "quality": 92, "max_dimension": 2048})")},
      {"Inline JPEG thumbnail from a full decode",
       detail::ExampleInput(R"({"input_path": "/photos/DSC_0042.NEF", "format": "jpg", )"
                            R"("max_dimension": 512, "force_highest_tier": true})")},
  };
  preview.handler = [&context](const Request& request, std::string_view request_id,
                               HandlerResult& result, OperationError& op_error) {
    return HandleRawPreview(context, request, request_id, result, op_error);
  };
  if (!router.Register(std::move(preview), error)) {
    return false;
  }

  OperationSpec metadata;
  metadata.name = "raw.metadata";
  metadata.description = "Read camera, lens and exposure metadata from a RAW photo.";
  metadata.tags = {"raw", "metadata", "exif"};
  metadata.side_effects = {"reads input_path"};
  metadata.idempotent = true;
  metadata.latency_target_ms = 50;
  if (!detail::ParseOperationSchema(metadata.name, kRawMetadataInputSchema,
                                    metadata.input_schema, error) ||
      !detail::ParseOperationSchema(metadata.name, kRawMetadataOutputSchema,
                                    metadata.output_schema, error)) {
    return false;
  }
  metadata.examples = {
      {"Metadata of a DNG file",
       detail::ExampleInput(R"({"input_path": "/photos/IMG_0001.DNG"})")},
  };
  metadata.handler = [&context](const Request& request, std::string_view request_id,
                                HandlerResult& result, OperationError& op_error) {
    return HandleRawMetadata(context, request, request_id, result, op_error);
  };
  return router.Register(std::move(metadata), error);
}

} // namespace mediaprep::service
