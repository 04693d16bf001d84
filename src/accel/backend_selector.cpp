#include "accel/backend_selector.hpp"

#include "core/cascade.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>

namespace mediaprep::accel {

namespace {

std::vector<CapabilityProbe> NormalizeProbes(std::vector<CapabilityProbe> probes) {
  const auto reference_it =
      std::find_if(probes.begin(), probes.end(), [](const CapabilityProbe& probe) {
        return probe.backend == Backend::kReference;
      });
  if (reference_it == probes.end()) {
    probes.push_back(MakeReferenceProbe());
    return probes;
  }
  probes.erase(std::next(reference_it), probes.end());
  return probes;
}

} // namespace

BackendSelector::BackendSelector(std::vector<CapabilityProbe> probes,
                                 core::logging::Logger* logger)
    : probes_(NormalizeProbes(std::move(probes))), logger_(logger) {}

BackendSelection BackendSelector::Select() {
  select_calls_.fetch_add(1U, std::memory_order_relaxed);
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    if (cached_ != nullptr) {
      return *cached_;
    }
  }

  std::unique_lock<std::shared_mutex> lock(mu_);
  if (cached_ != nullptr) {
    return *cached_;
  }

  cached_ = std::make_shared<const BackendSelection>(RunProbes());
  ++probe_runs_;
  return *cached_;
}

void BackendSelector::Reset() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  cached_.reset();
}

Backend BackendSelector::ActiveBackend() {
  return Select().backend;
}

BackendSelector::Snapshot BackendSelector::DebugSnapshot() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  Snapshot snapshot;
  snapshot.selected = cached_ != nullptr;
  snapshot.probe_runs = probe_runs_;
  snapshot.select_calls = select_calls_.load(std::memory_order_relaxed);
  return snapshot;
}

BackendSelection BackendSelector::RunProbes() {
  struct Winner {
    Backend backend;
    std::string identifier;
  };

  std::vector<core::CascadeCandidate<Winner>> candidates;
  candidates.reserve(probes_.size());
  for (const CapabilityProbe& probe : probes_) {
    candidates.push_back(core::CascadeCandidate<Winner>{
        probe.name,
        [this, &probe](std::string& reason) -> std::optional<Winner> {
          std::string identifier;
          bool ok = false;
          if (probe.attempt) {
            ok = probe.attempt(identifier, reason);
          } else {
            reason = "probe has no attempt function";
          }

          if (!ok) {
            if (reason.empty()) {
              reason = "initialization failed";
            }
            if (logger_ != nullptr) {
              logger_->Warn("backend_probe_failed",
                            {{"backend", probe.name}, {"reason", reason}});
            }
            return std::nullopt;
          }
          if (identifier.empty()) {
            identifier = probe.name;
          }
          return Winner{probe.backend, std::move(identifier)};
        }});
  }

  core::CascadeOutcome<Winner> outcome = core::RunCascade(candidates);

  BackendSelection selection;
  for (const auto& rejection : outcome.rejections) {
    const auto probe_it =
        std::find_if(probes_.begin(), probes_.end(),
                     [&rejection](const CapabilityProbe& probe) {
                       return probe.name == rejection.name;
                     });
    const Backend backend = probe_it == probes_.end() ? Backend::kReference : probe_it->backend;
    selection.failed.push_back(FailedCandidate{backend, rejection.name, rejection.reason});
  }

  if (outcome.succeeded()) {
    selection.backend = outcome.value->backend;
    selection.identifier = std::move(outcome.value->identifier);
  } else {
    // Only reachable when an injected reference probe misbehaves. The CPU
    // path has no initialization, so it is still usable.
    selection.backend = Backend::kReference;
    selection.identifier = std::string(ToString(Backend::kReference));
  }

  if (logger_ != nullptr) {
    logger_->Info("backend_selected",
                  {{"backend", ToString(selection.backend)},
                   {"identifier", selection.identifier},
                   {"failed_candidates", std::to_string(selection.failed.size())}});
  }
  return selection;
}

} // namespace mediaprep::accel
