#pragma once

#include "accel/backend.hpp"
#include "accel/capability_probe.hpp"
#include "core/logging/logger.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mediaprep::accel {

struct FailedCandidate {
  Backend backend = Backend::kReference;
  std::string name;
  std::string reason;
};

// Outcome of one probe run. `backend` is always usable; when every
// acceleration candidate failed it is kReference.
struct BackendSelection {
  Backend backend = Backend::kReference;
  std::string identifier;
  std::vector<FailedCandidate> failed;
};

// Process-lifetime backend cascade.
//
// Select() probes candidates in order exactly once and caches the winner.
// Concurrent first callers block on the writer lock until that single probe
// run finishes; later callers only take the shared lock to copy the cached
// value. Reset() drops the cache so the next Select() probes again.
class BackendSelector {
public:
  // A reference probe is appended when `probes` has none. Any probes listed
  // after a reference probe are dropped since they could never be reached.
  explicit BackendSelector(std::vector<CapabilityProbe> probes,
                           core::logging::Logger* logger = nullptr);

  BackendSelector(const BackendSelector&) = delete;
  BackendSelector& operator=(const BackendSelector&) = delete;

  BackendSelection Select();

  void Reset();

  // Backend of the cached selection, or Select() if nothing is cached yet.
  Backend ActiveBackend();

  const std::vector<CapabilityProbe>& probes() const {
    return probes_;
  }

  // Counters used by tests to verify one-time probing.
  struct Snapshot {
    bool selected = false;
    std::uint64_t probe_runs = 0;
    std::uint64_t select_calls = 0;
  };

  Snapshot DebugSnapshot() const;

private:
  BackendSelection RunProbes();

  std::vector<CapabilityProbe> probes_;
  core::logging::Logger* logger_ = nullptr;

  mutable std::shared_mutex mu_;
  std::shared_ptr<const BackendSelection> cached_;
  std::uint64_t probe_runs_ = 0;
  std::atomic<std::uint64_t> select_calls_{0};
};

} // namespace mediaprep::accel
