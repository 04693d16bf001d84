#pragma once

#include "accel/backend_selector.hpp"
#include "accel/capability_probe.hpp"
#include "core/config/service_config.hpp"
#include "core/logging/logger.hpp"
#include "media/transcoder.hpp"
#include "raw/preview_pipeline.hpp"
#include "raw/raw_decoder.hpp"
#include "service/capability_card.hpp"
#include "service/metrics_collector.hpp"
#include "service/operation_router.hpp"
#include "service/operations.hpp"
#include "service/request.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mediaprep::service {

// Injection points for tests and tooling. Anything left empty is built from
// the configuration: the LibRaw decoder (or its unavailable stand-in) and the
// probe list named by `accel_candidates`.
struct ServiceDependencies {
  std::unique_ptr<raw::IRawDecoder> decoder;
  std::optional<std::vector<accel::CapabilityProbe>> probes;
};

ServiceIdentity DefaultServiceIdentity();

// Owns every collaborator of the built-in operations and the frozen router
// that dispatches to them.
//
// Lifecycle: construct, Initialize() once, then Dispatch() from any number of
// threads. Nothing is registered after Initialize() returns.
class MediaService {
public:
  MediaService(core::config::ServiceConfig config, core::logging::Logger* logger,
               ServiceDependencies dependencies = {});

  MediaService(const MediaService&) = delete;
  MediaService& operator=(const MediaService&) = delete;

  bool Initialize(std::string& error);

  Outcome Dispatch(const Request& request);

  const CapabilityCard& card() const;
  const core::config::ServiceConfig& config() const {
    return config_;
  }
  accel::BackendSelector& selector() {
    return selector_;
  }
  MetricsCollector& metrics() {
    return metrics_;
  }
  const OperationRouter& router() const {
    return router_;
  }

private:
  core::config::ServiceConfig config_;
  core::logging::Logger* logger_ = nullptr;
  std::chrono::steady_clock::time_point started_at_;
  MetricsCollector metrics_;
  accel::BackendSelector selector_;
  std::unique_ptr<raw::IRawDecoder> decoder_;
  raw::PreviewPipeline preview_;
  media::Transcoder transcoder_;
  OperationRouter router_;
  std::unique_ptr<OperationContext> context_;
  std::optional<CapabilityCard> card_;
};

} // namespace mediaprep::service
