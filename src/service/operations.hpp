#pragma once

#include "accel/backend_selector.hpp"
#include "core/config/service_config.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "media/transcoder.hpp"
#include "raw/preview_pipeline.hpp"
#include "raw/raw_decoder.hpp"
#include "service/capability_card.hpp"
#include "service/metrics_collector.hpp"
#include "service/operation_router.hpp"
#include "service/schema_validator.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace mediaprep::service {

// Collaborators the built-in handlers close over. Owned by MediaService and
// outliving the router.
struct OperationContext {
  const core::config::ServiceConfig& config;
  core::logging::Logger* logger = nullptr;
  accel::BackendSelector& selector;
  raw::IRawDecoder& decoder;
  raw::PreviewPipeline& preview;
  const media::Transcoder& transcoder;
  MetricsCollector& metrics;
  std::chrono::steady_clock::time_point started_at;
  std::function<core::json::Value()> capability_card_json;
};

// raw.preview, raw.metadata
bool RegisterRawOperations(OperationRouter& router, const OperationContext& context,
                           std::string& error);

// image.preprocess, audio.preprocess, video.extract_frames
bool RegisterMediaOperations(OperationRouter& router, const OperationContext& context,
                             std::string& error);

// media.capabilities, media.metrics, health
bool RegisterSystemOperations(OperationRouter& router, const OperationContext& context,
                              std::string& error);

namespace detail {

// Parses the schema text of operation `op_name`, prefixing errors with it.
bool ParseOperationSchema(std::string_view op_name, std::string_view text,
                          core::json::Value& schema, std::string& error);

// Overrides `properties.<property>.default` in an object schema.
void SetPropertyDefault(core::json::Value& schema, std::string_view property,
                        core::json::Value value);

// ProcessingError with `details.field` unless `path` is an existing file.
bool RequireExistingFile(const std::filesystem::path& path, std::string_view field,
                         OperationError& error);

// Integer property `key` of `input` (or `fallback` when absent) narrowed to
// int. Values that do not fit are a ValidationError naming `$.<key>`.
bool ReadIntField(const core::json::Value& input, std::string_view key, std::int64_t fallback,
                  int& out, OperationError& error);

core::json::Value ExampleInput(std::string_view json_text);

} // namespace detail

} // namespace mediaprep::service
