#include "service/media_service.hpp"

#include <stdexcept>
#include <utility>

namespace mediaprep::service {

namespace {

std::vector<accel::CapabilityProbe> ResolveProbes(
    const core::config::ServiceConfig& config,
    std::optional<std::vector<accel::CapabilityProbe>>& injected) {
  if (injected.has_value()) {
    return std::move(*injected);
  }
  return accel::BuildProbes(config.accel_candidates);
}

std::unique_ptr<raw::IRawDecoder> ResolveDecoder(std::unique_ptr<raw::IRawDecoder> injected) {
  if (injected != nullptr) {
    return injected;
  }
  return raw::CreateRawDecoder();
}

} // namespace

ServiceIdentity DefaultServiceIdentity() {
  ServiceIdentity identity;
  identity.name = std::string(kServiceName);
  identity.version = std::string(kServiceVersion);
  identity.description =
      "Media preprocessing: RAW previews and metadata, image resizing, audio resampling and "
      "video frame extraction with hardware-accelerated resize when available.";
  identity.division = "media";
  identity.subsystem = "preprocessing";
  identity.tags = {"media", "raw", "image", "audio", "video", "preprocessing"};
  return identity;
}

MediaService::MediaService(core::config::ServiceConfig config, core::logging::Logger* logger,
                           ServiceDependencies dependencies)
    : config_(std::move(config)),
      logger_(logger),
      started_at_(std::chrono::steady_clock::now()),
      selector_(ResolveProbes(config_, dependencies.probes), logger_),
      decoder_(ResolveDecoder(std::move(dependencies.decoder))),
      preview_(*decoder_, selector_, logger_),
      transcoder_(config_.ffmpeg_path, logger_),
      router_(metrics_, logger_) {}

bool MediaService::Initialize(std::string& error) {
  if (router_.frozen()) {
    error = "service is already initialized";
    return false;
  }

  context_ = std::make_unique<OperationContext>(OperationContext{
      .config = config_,
      .logger = logger_,
      .selector = selector_,
      .decoder = *decoder_,
      .preview = preview_,
      .transcoder = transcoder_,
      .metrics = metrics_,
      .started_at = started_at_,
      .capability_card_json = [this]() { return card().ToJson(); },
  }));

  if (!RegisterRawOperations(router_, *context_, error) ||
      !RegisterMediaOperations(router_, *context_, error) ||
      !RegisterSystemOperations(router_, *context_, error)) {
    return false;
  }
  router_.Freeze();

  card_.emplace(DefaultServiceIdentity(), router_, [this]() {
    const accel::BackendSelection selection = selector_.Select();
    return ActiveBackendInfo{.backend = std::string(accel::ToString(selection.backend)),
                             .identifier = selection.identifier};
  });

  if (logger_ != nullptr) {
    logger_->Info("service_initialized",
                  {{"operations", std::to_string(router_.operations().size())},
                   {"raw_decoder", decoder_->Name()},
                   {"accel_candidates", core::config::FormatAccelList(config_.accel_candidates)}});
  }
  return true;
}

Outcome MediaService::Dispatch(const Request& request) {
  return router_.Dispatch(request);
}

const CapabilityCard& MediaService::card() const {
  if (!card_.has_value()) {
    throw std::logic_error("MediaService::card() called before Initialize()");
  }
  return *card_;
}

} // namespace mediaprep::service
